/*
===============================================================================
 podkit Pod capability (zero-copy typed views)
===============================================================================

A Pod type can be viewed as raw bytes, and raw bytes can be viewed as a Pod
type, without copying or parsing.

Eligibility is a caller assertion that cannot be verified by the compiler:

  • The type has a stable binary layout (no implicit padding that carries
    meaning; declare explicit pad_ members instead).
  • Every bit pattern of sizeof(T) bytes is a valid value.

This rules out bool, pointers, and any type with invariants over its
bytes. Violating the assertion is undefined behavior.

The capability is sealed: pod_traits<T> is false for every type until it is
granted with PODKIT_DECLARE_POD(T). The grant additionally checks what CAN be
checked at compile time (trivially copyable, standard layout, not bool, not a
pointer).

Size or alignment mismatches are reported as absence, never as an error:
probing unknown data for a shape that is not there is a normal outcome.

The byte layout is the host's native representation. Portable formats must
pick fixed-width fields and convert endianness explicitly.
===============================================================================
*/
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <type_traits>

#include "podkit/types.hpp"
#include "podkit/align.hpp"
#include "podkit/numbers.hpp"


namespace podkit {

// -----------------------------------------------------------------------------
// Capability trait (sealed: false unless granted)
// -----------------------------------------------------------------------------
template <typename T>
struct pod_traits {
    static constexpr bool granted = false;
};

namespace detail {

template <typename T>
inline constexpr bool layout_eligible_v =
    std::is_trivially_copyable_v<T> &&
    std::is_standard_layout_v<T> &&
    !std::is_same_v<std::remove_cv_t<T>, bool> &&
    !std::is_pointer_v<T> &&
    !std::is_member_pointer_v<T> &&
    !std::is_reference_v<T> &&
    sizeof(T) != 0;

} // namespace detail

template <typename T>
concept Pod = pod_traits<std::remove_cv_t<T>>::granted;

// std::array of a Pod is a Pod (same layout guarantees, no padding between elements)
template <typename T, std::size_t N>
struct pod_traits<std::array<T, N>> {
    static_assert(detail::layout_eligible_v<std::array<T, N>>, "std::array element type breaks Pod layout");
    static constexpr bool granted = pod_traits<std::remove_cv_t<T>>::granted;
};

} // namespace podkit


// -----------------------------------------------------------------------------
// Grant the Pod capability to a type. Use at global namespace scope with a
// fully qualified type name.
// -----------------------------------------------------------------------------
#define PODKIT_DECLARE_POD(Type)                                                 \
    namespace podkit {                                                           \
    template <>                                                                  \
    struct pod_traits<Type> {                                                    \
        static_assert(::podkit::detail::layout_eligible_v<Type>,                 \
                      #Type " must be trivially copyable, standard layout, "     \
                      "and must not be bool or a pointer");                      \
        static constexpr bool granted = true;                                    \
    };                                                                           \
    }

PODKIT_DECLARE_POD(char)
PODKIT_DECLARE_POD(signed char)
PODKIT_DECLARE_POD(unsigned char)
PODKIT_DECLARE_POD(std::byte)
PODKIT_DECLARE_POD(short)
PODKIT_DECLARE_POD(unsigned short)
PODKIT_DECLARE_POD(int)
PODKIT_DECLARE_POD(unsigned int)
PODKIT_DECLARE_POD(long)
PODKIT_DECLARE_POD(unsigned long)
PODKIT_DECLARE_POD(long long)
PODKIT_DECLARE_POD(unsigned long long)
PODKIT_DECLARE_POD(float)
PODKIT_DECLARE_POD(double)


namespace podkit {

// -----------------------------------------------------------------------------
// View results
// -----------------------------------------------------------------------------
template <Pod T>
struct prefix_view {
    const T* value;
    bytes rest;       // trailing bytes after the value
};

template <Pod T>
struct slice_prefix_view {
    std::span<const T> items;
    bytes rest;       // trailing bytes after the slice
};

// -----------------------------------------------------------------------------
// Value / slice → bytes (always succeeds)
// -----------------------------------------------------------------------------
template <Pod T>
    requires (!std::ranges::contiguous_range<T>)
[[nodiscard]] inline bytes as_bytes(const T& value) noexcept {
    return bytes(reinterpret_cast<const std::uint8_t*>(&value), sizeof(T));
}

// Any contiguous range of Pod elements: std::span, std::vector, std::array,
// std::string_view, ...
template <std::ranges::contiguous_range R>
    requires std::ranges::sized_range<R> && Pod<std::ranges::range_value_t<R>>
[[nodiscard]] inline bytes as_bytes(const R& range) noexcept {
    using T = std::ranges::range_value_t<R>;
    return bytes(reinterpret_cast<const std::uint8_t*>(std::ranges::data(range)),
                 std::ranges::size(range) * sizeof(T));
}

// -----------------------------------------------------------------------------
// Bytes → value / slice (checked; nullptr / nullopt when the shape does not fit)
// -----------------------------------------------------------------------------

// Exact size, aligned.
template <Pod T>
[[nodiscard]] inline const T* view_one(bytes b) noexcept {
    if (b.size() != sizeof(T) || !is_aligned_to(b, alignof(T))) {
        return nullptr;
    }
    return reinterpret_cast<const T*>(b.data());
}

// At least sizeof(T) bytes, aligned. Also returns the trailing bytes.
template <Pod T>
[[nodiscard]] inline std::optional<prefix_view<T>> view_one_prefix(bytes b) noexcept {
    if (b.size() < sizeof(T) || !is_aligned_to(b, alignof(T))) {
        return std::nullopt;
    }
    return prefix_view<T>{ reinterpret_cast<const T*>(b.data()), b.subspan(sizeof(T)) };
}

// Size is a multiple of sizeof(T), aligned. Holds every element that fits.
template <Pod T>
[[nodiscard]] inline std::optional<std::span<const T>> view_slice(bytes b) noexcept {
    static_assert(sizeof(T) != 0, "view_slice: zero-sized element type");
    if (b.size() % sizeof(T) != 0 || !is_aligned_to(b, alignof(T))) {
        return std::nullopt;
    }
    return std::span<const T>(reinterpret_cast<const T*>(b.data()), b.size() / sizeof(T));
}

// Room for `count` elements, aligned. Also returns the trailing bytes.
template <Pod T>
[[nodiscard]] inline std::optional<slice_prefix_view<T>> view_slice_prefix(bytes b, std::size_t count) noexcept {
    static_assert(sizeof(T) != 0, "view_slice_prefix: zero-sized element type");
    std::size_t expected = 0;
    if (!checked_mul(sizeof(T), count, expected)) {
        return std::nullopt;
    }
    if (b.size() < expected || !is_aligned_to(b, alignof(T))) {
        return std::nullopt;
    }
    return slice_prefix_view<T>{
        std::span<const T>(reinterpret_cast<const T*>(b.data()), count),
        b.subspan(expected)
    };
}

} // namespace podkit
