#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include <simdjson.h>


namespace podkit {
namespace utf8 {

// Strict UTF-8 validation (rejects overlong forms, surrogates and code
// points above U+10FFFF). Backed by simdjson's SIMD validator.
[[nodiscard]] inline bool is_valid(const char* data, std::size_t size) noexcept {
    return size == 0 || simdjson::validate_utf8(data, size);
}

[[nodiscard]] inline bool is_valid(std::string_view s) noexcept {
    return is_valid(s.data(), s.size());
}

[[nodiscard]] inline bool is_valid(std::span<const char> s) noexcept {
    return is_valid(s.data(), s.size());
}

} // namespace utf8
} // namespace podkit
