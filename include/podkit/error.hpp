#pragma once

#include <cstdint>
#include <string_view>

namespace podkit {

/*
===============================================================================
 podkit::Error
===============================================================================

Data-level error classification for the blob store, the string table and the
writer.

A size or alignment mismatch in the casting layer is NOT an error: the
view_* functions report it as absence (null / empty optional).

Caller-contract violations are NOT errors either: they terminate the process
through PK_REQUIRE.

Every failure is a deterministic property of the input. Retrying never helps.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Decoding ------------------------------------------------------------
    MalformedLength,  // LEB128 length prefix is truncated or overflows 64 bits
    OutOfBounds,      // Offset or computed entry range lies outside the buffer

    // --- Content -------------------------------------------------------------
    InvalidContent,   // A user supplied validator rejected a decoded entry
    InvalidUtf8,      // String table entry (or input text) is not valid UTF-8

    // --- Output --------------------------------------------------------------
    WriteFailed,      // Output sink stopped accepting bytes
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:            return "None";
    case Error::MalformedLength: return "MalformedLength";
    case Error::OutOfBounds:     return "OutOfBounds";
    case Error::InvalidContent:  return "InvalidContent";
    case Error::InvalidUtf8:     return "InvalidUtf8";
    case Error::WriteFailed:     return "WriteFailed";
    default:                     return "Unknown";
    }
}

// Human-readable description, used by the example tools.
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:            return "success";
    case Error::MalformedLength: return "error reading LEB128 encoded length";
    case Error::OutOfBounds:     return "entry offset or length is out of bounds";
    case Error::InvalidContent:  return "entry rejected by validator";
    case Error::InvalidUtf8:     return "entry is not valid UTF-8";
    case Error::WriteFailed:     return "output sink failed";
    default:                     return "unknown error";
    }
}

} // namespace podkit
