#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "podkit/types.hpp"
#include "podkit/numbers.hpp"
#include "podkit/contract.hpp"


namespace podkit {

// Returns true if the first byte of `b` sits on a multiple of `align`.
// `align` must be a power of two.
[[nodiscard]] inline bool is_aligned_to(bytes b, std::size_t align) noexcept {
    PK_REQUIRE(is_power_of_two(align), "is_aligned_to: align is not a power of two");
    return (reinterpret_cast<std::uintptr_t>(b.data()) & (align - 1)) == 0;
}

// Result of align_to(): `prefix` holds the padding bytes, `suffix` starts at
// the first aligned address. prefix.size() + suffix.size() == input size.
struct aligned_split {
    bytes prefix;
    bytes suffix;
};

// Splits `b` into padding and a suffix aligned to `align` bytes.
// Used to skip the padding a writer inserted between two sections.
// Returns nullopt when `b` is shorter than the required padding.
[[nodiscard]] inline std::optional<aligned_split> align_to(bytes b, std::size_t align) noexcept {
    PK_REQUIRE(is_power_of_two(align), "align_to: align is not a power of two");
    const std::size_t pad = padding_for(reinterpret_cast<std::uintptr_t>(b.data()), align);
    if (b.size() < pad) {
        return std::nullopt;
    }
    return aligned_split{ b.first(pad), b.subspan(pad) };
}

template <typename T>
[[nodiscard]] inline std::optional<aligned_split> align_to_type(bytes b) noexcept {
    return align_to(b, alignof(T));
}

} // namespace podkit
