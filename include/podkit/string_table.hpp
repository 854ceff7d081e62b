#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "podkit/types.hpp"
#include "podkit/error.hpp"
#include "podkit/offset_set.hpp"
#include "podkit/utf8.hpp"
#include "podkit/contract.hpp"
#include "podkit/memory/footprint.hpp"


namespace podkit {

/*
===============================================================================
 podkit::StringTable
===============================================================================

Interned UTF-8 strings, each stored once, addressed by byte offset.

    StringTable table;
    auto foo = table.insert("foo");   // 0
    auto bar = table.insert("bar");   // 4

    bytes buf = table.as_bytes();     // 03 'f' 'o' 'o' 03 'b' 'a' 'r'
    std::string_view s;
    StringTable::read(buf, foo, s);   // Error::None, s == "foo"

The serialized form is exactly OffsetSet<char>'s: the strings, each prefixed
with its LEB128 byte length. The empty string is an ordinary zero-length entry
(a single 0x00 byte); no offset is reserved for it.

read() validates UTF-8 every time, since the buffer may come from anywhere.
from_bytes() validates every entry once while loading.
===============================================================================
*/
class StringTable {
public:
    static constexpr std::size_t npos = OffsetSet<char>::npos;

    StringTable() = default;

    // Interns `s`, which must be valid UTF-8 (contract, checked).
    // Returns the offset of the string in the serialized form.
    std::size_t insert(std::string_view s) {
        PK_REQUIRE(utf8::is_valid(s), "StringTable::insert: text is not valid UTF-8");
        return set_.insert(std::span<const char>(s.data(), s.size()));
    }

    // Recoverable variant of insert(): rejects invalid UTF-8 with
    // Error::InvalidUtf8 and leaves the table unchanged.
    [[nodiscard]] Error try_insert(std::string_view s, std::size_t& offset) {
        if (!utf8::is_valid(s)) {
            return Error::InvalidUtf8;
        }
        offset = set_.insert(std::span<const char>(s.data(), s.size()));
        return Error::None;
    }

    [[nodiscard]] std::size_t find(std::string_view s) const {
        return set_.find(std::span<const char>(s.data(), s.size()));
    }

    // Resolves `offset` against a serialized table.
    //
    // Errors: OutOfBounds, MalformedLength, InvalidUtf8.
    [[nodiscard]] static Error read(bytes buffer, std::size_t offset, std::string_view& out) noexcept {
        std::span<const char> raw;
        if (Error err = OffsetSet<char>::read(buffer, offset, raw); err != Error::None) {
            return err;
        }
        if (!utf8::is_valid(raw)) {
            return Error::InvalidUtf8;
        }
        out = std::string_view(raw.data(), raw.size());
        return Error::None;
    }

    // Rebuilds a table from a buffer previously obtained with as_bytes().
    // Every entry must be valid UTF-8.
    [[nodiscard]] static Error from_bytes(bytes buffer, StringTable& out) {
        return OffsetSet<char>::from_bytes_validated(
            buffer,
            [](std::span<const char> raw) noexcept {
                return utf8::is_valid(raw) ? Error::None : Error::InvalidUtf8;
            },
            out.set_);
    }

    [[nodiscard]] inline bytes as_bytes() const noexcept { return set_.as_bytes(); }

    [[nodiscard]] inline std::vector<std::uint8_t> into_bytes() && noexcept {
        return std::move(set_).into_bytes();
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return set_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return set_.empty(); }
    [[nodiscard]] inline std::size_t byte_size() const noexcept { return set_.byte_size(); }

    // Calls fn(offset, std::string_view) for every string, in buffer order.
    template <typename Fn>
    void for_each_entry(Fn&& fn) const {
        set_.for_each_entry([&](std::size_t offset, std::span<const char> raw) {
            fn(offset, std::string_view(raw.data(), raw.size()));
        });
    }

    [[nodiscard]] std::vector<std::pair<std::size_t, std::string_view>> entries() const {
        std::vector<std::pair<std::size_t, std::string_view>> out;
        out.reserve(size());
        for_each_entry([&](std::size_t offset, std::string_view s) {
            out.emplace_back(offset, s);
        });
        return out;
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        memory::footprint fp;
        fp.add_static(sizeof(*this));
        fp.add_embedded(set_);
        return fp;
    }

    inline void dump(std::ostream& os) const {
        os << "[STRING TABLE] {strings=" << size() << ", bytes=" << byte_size() << ", items={";
        bool first = true;
        for_each_entry([&](std::size_t offset, std::string_view s) {
            if (!first) os << ", ";
            first = false;
            os << offset << ": \"" << s << "\"";
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
    OffsetSet<char> set_;
};

} // namespace podkit
