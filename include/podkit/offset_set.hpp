/*
===============================================================================
 podkit::OffsetSet<T>
===============================================================================

Append-only, deduplicating store of Pod slices addressed by byte offset.

Think of it as an insertion-ordered set of slices that hands out the byte
offset of the encoded slice instead of an index, and that serializes to an
opaque buffer which can be read back with no loading step.

Wire format (no header, no trailer, no index section):

    entry  := LEB128(element_count) || raw bytes (element_count * sizeof(T))
    buffer := entry*

An offset points at the length prefix of its entry. Offsets are stable:
entries are never moved, rewritten or removed.

The in-memory index maps content hashes (XXH64) to offsets only. Equality is
decided by comparing bytes re-read from the buffer, never by hash alone.

T must be a Pod with alignment 1, so entries never need padding.

Not thread-safe. Static read() over an immutable buffer is safe from any
number of threads.
===============================================================================
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <xxhash.h>

#include "podkit/types.hpp"
#include "podkit/error.hpp"
#include "podkit/config.hpp"
#include "podkit/pod.hpp"
#include "podkit/leb128.hpp"
#include "podkit/numbers.hpp"
#include "podkit/detail/offset_index.hpp"
#include "podkit/memory/footprint.hpp"
#include "podkit/log/logger.hpp"


namespace podkit {

template <Pod T>
class OffsetSet {
    static_assert(alignof(T) == 1, "OffsetSet element type must have alignment 1");

public:
    using value_type = T;
    using slice_type = std::span<const T>;

    OffsetSet() = default;

    // -------------------------------------------------------------------------
    // Reading (static: works on any serialized buffer)
    // -------------------------------------------------------------------------

    // Resolves `offset` against a serialized buffer.
    //
    // Errors:
    //   OutOfBounds     - offset past the end, or entry extends past the end
    //   MalformedLength - length prefix is not valid LEB128
    [[nodiscard]] static Error read(bytes buffer, std::size_t offset, slice_type& out) noexcept {
        std::size_t next = 0;
        return read_entry(buffer, offset, out, next);
    }

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    // Rebuilds a set from a buffer previously obtained with as_bytes().
    [[nodiscard]] static Error from_bytes(bytes buffer, OffsetSet& out) {
        return from_bytes_validated(buffer, [](slice_type) noexcept { return Error::None; }, out);
    }

    // Same as from_bytes(), running every decoded entry through
    // `validate(slice_type) -> Error`. The first failure aborts the load and
    // is returned as is; `out` is only assigned on success.
    template <typename Validator>
    [[nodiscard]] static Error from_bytes_validated(bytes buffer, Validator&& validate, OffsetSet& out) {
        OffsetSet loaded;
        loaded.buffer_.assign(buffer.begin(), buffer.end());

        const bytes data(loaded.buffer_);
        std::size_t offset = 0;
        while (offset < data.size()) {
            slice_type item;
            std::size_t next = 0;
            if (Error err = read_entry(data, offset, item, next); err != Error::None) {
                PK_TRACE("[!!] OffsetSet load failed at offset " << offset << ": " << to_string(err));
                return err;
            }
            if (Error err = validate(item); err != Error::None) {
                PK_TRACE("[!!] OffsetSet entry rejected at offset " << offset << ": " << to_string(err));
                return err;
            }
            const bytes key = podkit::as_bytes(item);
            loaded.index_.assign(hash_of(key), loaded.matcher(key), offset);
            offset = next;
        }

        out = std::move(loaded);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Writing
    // -------------------------------------------------------------------------

    // Inserts `items` unless an equal slice is already stored.
    // Returns the offset of the (new or existing) entry.
    std::size_t insert(slice_type items) {
        const bytes key = podkit::as_bytes(items);
        return index_.find_or_insert(hash_of(key), matcher(key), [&] {
            const std::size_t offset = buffer_.size();
            if (aliases_buffer(key)) {
                // Growing the buffer would invalidate `key`.
                const std::vector<std::uint8_t> copy(key.begin(), key.end());
                leb128::encode(static_cast<std::uint64_t>(items.size()), buffer_);
                buffer_.insert(buffer_.end(), copy.begin(), copy.end());
            } else {
                leb128::encode(static_cast<std::uint64_t>(items.size()), buffer_);
                buffer_.insert(buffer_.end(), key.begin(), key.end());
            }
            return offset;
        });
    }

    // Offset of an equal slice if one is stored, npos otherwise. Never
    // modifies the buffer.
    [[nodiscard]] std::size_t find(slice_type items) const {
        const bytes key = podkit::as_bytes(items);
        return index_.find(hash_of(key), matcher(key));
    }

    [[nodiscard]] bool contains(slice_type items) const {
        return find(items) != npos;
    }

    static constexpr std::size_t npos = detail::offset_index::npos;

    // -------------------------------------------------------------------------
    // Serialized form
    // -------------------------------------------------------------------------

    [[nodiscard]] inline bytes as_bytes() const noexcept {
        return bytes(buffer_);
    }

    [[nodiscard]] inline std::vector<std::uint8_t> into_bytes() && noexcept {
        index_.clear();
        return std::move(buffer_);
    }

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    // Number of unique entries.
    [[nodiscard]] inline std::size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return index_.empty(); }

    // Size of the serialized buffer.
    [[nodiscard]] inline std::size_t byte_size() const noexcept { return buffer_.size(); }

    // Calls fn(offset, slice) for every entry, in buffer order.
    template <typename Fn>
    void for_each_entry(Fn&& fn) const {
        const bytes data(buffer_);
        std::size_t offset = 0;
        while (offset < data.size()) {
            slice_type item;
            std::size_t next = 0;
            if (read_entry(data, offset, item, next) != Error::None) {
                return; // unreachable for a validated buffer
            }
            fn(offset, item);
            offset = next;
        }
    }

    [[nodiscard]] std::vector<std::pair<std::size_t, slice_type>> entries() const {
        std::vector<std::pair<std::size_t, slice_type>> out;
        out.reserve(size());
        for_each_entry([&](std::size_t offset, slice_type item) {
            out.emplace_back(offset, item);
        });
        return out;
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(*this));
        fp.add_dynamic(buffer_.capacity());
        fp.add_embedded(index_);
        return fp;
    }

    // ---------------------------------------------------------
    // Dump
    // ---------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[OFFSET SET] {entries=" << size() << ", bytes=" << byte_size() << ", items={";
        bool first = true;
        for_each_entry([&](std::size_t offset, slice_type item) {
            if (!first) os << ", ";
            first = false;
            os << offset << ": [";
            for (std::size_t i = 0; i < item.size(); ++i) {
                if (i) os << ", ";
                dump_element(os, item[i]);
            }
            os << "]";
        });
        os << "}}";
    }

    // NOTE: Allocates. Intended for debugging/logging only.
    [[nodiscard]] inline std::string str() const {
        std::ostringstream oss;
        dump(oss);
        return oss.str();
    }

private:
    // Decodes the entry at `offset` and the offset of the entry after it.
    [[nodiscard]] static Error read_entry(bytes buffer, std::size_t offset,
                                          slice_type& out, std::size_t& next) noexcept {
        if (offset > buffer.size()) {
            return Error::OutOfBounds;
        }
        std::uint64_t count = 0;
        std::size_t prefix = 0;
        if (Error err = leb128::decode(buffer.subspan(offset), count, prefix); err != Error::None) {
            return err;
        }

        std::size_t payload = 0;
        std::size_t start = offset + prefix; // prefix <= remaining bytes
        std::size_t end = 0;
        if (count > static_cast<std::uint64_t>(npos) ||
            !checked_mul(static_cast<std::size_t>(count), sizeof(T), payload) ||
            !checked_add(start, payload, end) ||
            end > buffer.size()) {
            return Error::OutOfBounds;
        }

        auto slice = view_slice<T>(buffer.subspan(start, payload));
        if (!slice) {
            return Error::OutOfBounds;
        }
        out = *slice;
        next = end;
        return Error::None;
    }

    [[nodiscard]] static inline std::uint64_t hash_of(bytes key) noexcept {
        return XXH64(key.data(), key.size(), config::hash_seed);
    }

    // Equality closure over offsets: re-reads the entry from our own buffer.
    [[nodiscard]] inline auto matcher(bytes key) const noexcept {
        return [this, key](std::size_t offset) noexcept {
            slice_type stored;
            if (read(bytes(buffer_), offset, stored) != Error::None) {
                return false;
            }
            const bytes raw = podkit::as_bytes(stored);
            return raw.size() == key.size() &&
                   (raw.empty() || std::memcmp(raw.data(), key.data(), raw.size()) == 0);
        };
    }

    [[nodiscard]] inline bool aliases_buffer(bytes key) const noexcept {
        if (key.empty() || buffer_.empty()) {
            return false;
        }
        const auto* first = buffer_.data();
        const auto* last = first + buffer_.size();
        return std::less_equal<>{}(first, key.data()) && std::less<>{}(key.data(), last);
    }

    static inline void dump_element(std::ostream& os, const T& v) {
        if constexpr (sizeof(T) == 1 && std::is_integral_v<T>) {
            os << static_cast<unsigned>(static_cast<std::uint8_t>(v));
        } else if constexpr (requires { os << v; }) {
            os << v;
        } else {
            os << "<" << sizeof(T) << "B>";
        }
    }

private:
    std::vector<std::uint8_t> buffer_;
    detail::offset_index index_;
};

} // namespace podkit
