#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "podkit/config.hpp"
#include "podkit/numbers.hpp"
#include "podkit/memory/footprint.hpp"


namespace podkit {
namespace detail {

//------------------------------------------------------------------------------
// Open-addressing hash index over buffer offsets.
//
// The index stores offsets (plus the cached 64-bit hash of the entry they
// point to), never the keys themselves. Key comparison is delegated to the
// caller through an equality closure `eq(offset) -> bool`, which re-reads the
// entry from the owner's buffer. This keeps exactly one copy of every key:
// the serialized one.
//
// Characteristics:
//   • Linear probing, power-of-two capacity (mask instead of modulo)
//   • Grows by doubling once the load would exceed 7/8
//   • Growth re-slots using the cached hashes; no buffer reads
//   • No erase (the owning store is append-only)
//
// Thread-safety:
//   - NOT thread-safe. Owned by exactly one store.
//------------------------------------------------------------------------------
class offset_index {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    offset_index() = default;

    // Returns the offset of the entry matching `eq` among those stored under
    // `hash`, or npos.
    template <typename Eq>
    [[nodiscard]] std::size_t find(std::uint64_t hash, Eq&& eq) const {
        if (slots_.empty()) {
            return npos;
        }
        for (std::size_t i = home(hash);; i = (i + 1) & mask()) {
            const slot& s = slots_[i];
            if (s.offset == npos) {
                return npos;
            }
            if (s.hash == hash && eq(s.offset)) {
                return s.offset;
            }
        }
    }

    // Returns the offset of the matching entry if there is one. Otherwise
    // calls `make()` to append the entry, records the offset it returns and
    // returns that.
    template <typename Eq, typename Make>
    std::size_t find_or_insert(std::uint64_t hash, Eq&& eq, Make&& make) {
        reserve_one();
        std::size_t i = home(hash);
        for (;; i = (i + 1) & mask()) {
            const slot& s = slots_[i];
            if (s.offset == npos) {
                break;
            }
            if (s.hash == hash && eq(s.offset)) {
                return s.offset;
            }
        }
        const std::size_t offset = make();
        slots_[i] = slot{ hash, offset };
        ++count_;
        return offset;
    }

    // Records `offset` under `hash`. A matching entry already present is
    // replaced, so the latest occurrence wins.
    template <typename Eq>
    void assign(std::uint64_t hash, Eq&& eq, std::size_t offset) {
        reserve_one();
        std::size_t i = home(hash);
        for (;; i = (i + 1) & mask()) {
            slot& s = slots_[i];
            if (s.offset == npos) {
                s = slot{ hash, offset };
                ++count_;
                return;
            }
            if (s.hash == hash && eq(s.offset)) {
                s.offset = offset;
                return;
            }
        }
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return count_; }
    [[nodiscard]] inline bool empty() const noexcept { return count_ == 0; }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return slots_.size(); }

    inline void clear() noexcept {
        slots_.clear();
        count_ = 0;
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(*this));
        fp.add_dynamic(slots_.capacity() * sizeof(slot));
        return fp;
    }

private:
    struct slot {
        std::uint64_t hash{0};
        std::size_t offset{npos};
    };

    [[nodiscard]] inline std::size_t mask() const noexcept { return slots_.size() - 1; }

    [[nodiscard]] inline std::size_t home(std::uint64_t hash) const noexcept {
        return static_cast<std::size_t>(hash) & mask();
    }

    // Guarantees room for one more entry without exceeding the max load.
    void reserve_one() {
        if (slots_.empty()) {
            slots_.assign(config::index_initial_capacity, slot{});
            return;
        }
        if ((count_ + 1) * config::index_max_load_den <= slots_.size() * config::index_max_load_num) {
            return;
        }
        rehash(slots_.size() * 2);
    }

    void rehash(std::size_t new_capacity) {
        std::vector<slot> old(new_capacity, slot{});
        old.swap(slots_);
        for (const slot& s : old) {
            if (s.offset == npos) continue;
            std::size_t i = home(s.hash);
            while (slots_[i].offset != npos) {
                i = (i + 1) & mask();
            }
            slots_[i] = s;
        }
    }

    static_assert(is_power_of_two(config::index_initial_capacity),
                  "index_initial_capacity must be a power of two");
    static_assert(config::index_max_load_num < config::index_max_load_den,
                  "index max load must leave at least one free slot");

private:
    std::vector<slot> slots_;
    std::size_t count_{0};
};

} // namespace detail
} // namespace podkit
