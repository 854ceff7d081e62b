#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>


namespace podkit {

[[nodiscard]] inline constexpr bool is_power_of_two(std::size_t n) noexcept {
    return n != 0 && (n & (n - 1)) == 0;
}

// -----------------------------------------------------------------------------
// Overflow-checked arithmetic. Returns false (and leaves `out` untouched)
// when the result does not fit in std::size_t.
[[nodiscard]] inline constexpr bool checked_mul(std::size_t a, std::size_t b, std::size_t& out) noexcept {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

[[nodiscard]] inline constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
    if (b > std::numeric_limits<std::size_t>::max() - a) {
        return false;
    }
    out = a + b;
    return true;
}

// -----------------------------------------------------------------------------
// Bytes needed to move `position` forward to the next multiple of `align`.
// `align` must be a power of two.
[[nodiscard]] inline constexpr std::size_t padding_for(std::size_t position, std::size_t align) noexcept {
    return (align - (position & (align - 1))) & (align - 1);
}

} // namespace podkit
