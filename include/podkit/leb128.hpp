#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "podkit/types.hpp"
#include "podkit/error.hpp"
#include "podkit/config.hpp"


namespace podkit {
namespace leb128 {

// -----------------------------------------------------------------------------
// Unsigned LEB128: 7 data bits per byte, least significant group first,
// high bit set on every byte except the last.
// -----------------------------------------------------------------------------

[[nodiscard]] inline constexpr std::size_t encoded_length(std::uint64_t value) noexcept {
    std::size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++n;
    }
    return n;
}

// Writes the encoding of `value` to `out`, which must hold at least
// config::leb128_max_length bytes. Returns the number of bytes written.
inline std::size_t encode(std::uint64_t value, std::uint8_t* out) noexcept {
    std::size_t i = 0;
    while (value >= 0x80) {
        out[i++] = static_cast<std::uint8_t>((value & 0x7f) | 0x80);
        value >>= 7;
    }
    out[i++] = static_cast<std::uint8_t>(value & 0x7f);
    return i;
}

// Appends the encoding of `value` to `out`. Returns the number of bytes appended.
inline std::size_t encode(std::uint64_t value, std::vector<std::uint8_t>& out) {
    std::uint8_t tmp[config::leb128_max_length];
    const std::size_t n = encode(value, tmp);
    out.insert(out.end(), tmp, tmp + n);
    return n;
}

// Decodes one value from the front of `in`.
//
// On success stores the value and the number of bytes consumed.
// Returns Error::MalformedLength if the input ends before the final byte, or
// if the encoded value does not fit in 64 bits. Non-minimal encodings
// (e.g. 0x80 0x00) are accepted.
[[nodiscard]] inline Error decode(bytes in, std::uint64_t& value, std::size_t& length) noexcept {
    std::uint64_t result = 0;
    unsigned shift = 0;

    for (std::size_t i = 0; i < in.size(); ++i) {
        const std::uint8_t byte = in[i];

        // The 10th byte may only contribute the single remaining bit.
        if (shift == 63 && byte != 0x00 && byte != 0x01) {
            return Error::MalformedLength;
        }

        result |= static_cast<std::uint64_t>(byte & 0x7f) << shift;

        if ((byte & 0x80) == 0) {
            value = result;
            length = i + 1;
            return Error::None;
        }

        shift += 7;
        if (shift > 63) {
            return Error::MalformedLength;
        }
    }

    return Error::MalformedLength; // truncated
}

} // namespace leb128
} // namespace podkit
