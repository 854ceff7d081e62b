#pragma once

#include <cstdint>
#include <ostream>


namespace podkit {
namespace memory {

// Memory footprint of a component: bytes held inline (static) and bytes
// held on the heap (dynamic, counted by capacity, not size).
struct footprint {
    std::uint64_t static_bytes{0};
    std::uint64_t dynamic_bytes{0};

    inline constexpr std::uint64_t total_bytes() const noexcept {
        return static_bytes + dynamic_bytes;
    }

    inline constexpr void add(const footprint& other) noexcept {
        static_bytes += other.static_bytes;
        dynamic_bytes += other.dynamic_bytes;
    }

    inline constexpr void add_static(std::uint64_t bytes) noexcept {
        static_bytes += bytes;
    }

    inline constexpr void add_dynamic(std::uint64_t bytes) noexcept {
        dynamic_bytes += bytes;
    }

    // Heap bytes owned by a subcomponent embedded by value: its inline part
    // is already covered by the owner's sizeof.
    template <typename T>
    inline constexpr void add_embedded(const T& component) noexcept {
        if constexpr (requires { component.memory_usage(); }) {
            dynamic_bytes += component.memory_usage().dynamic_bytes;
        } else {
            static_assert(sizeof(T) == 0, "Type passed to add_embedded() must implement memory_usage()");
        }
    }

    inline void dump(std::ostream& os) const {
        os << "{static=" << static_bytes << "B, dynamic=" << dynamic_bytes
           << "B, total=" << total_bytes() << "B}";
    }
};

} // namespace memory
} // namespace podkit
