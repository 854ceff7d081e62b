#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "podkit/types.hpp"
#include "podkit/error.hpp"
#include "podkit/config.hpp"
#include "podkit/numbers.hpp"
#include "podkit/contract.hpp"
#include "podkit/pod.hpp"
#include "podkit/sink.hpp"
#include "podkit/log/logger.hpp"


namespace podkit {

//------------------------------------------------------------------------------
// Writer
//
// Wraps an output sink and counts the bytes it accepted. The count is what
// makes explicit alignment possible: align_to() pads with zero bytes until
// the position is a multiple of the requested alignment, so that a reader
// can later view the next section in place.
//
// Example:
//   Writer<vector_sink> w{vector_sink{}};
//   w.write_all(podkit::as_bytes(header));
//   w.align_to_type<Record>();
//   w.write_all(podkit::as_bytes(records));
//   w.write_all(strings.as_bytes());
//
// Thread-safety:
//   - NOT thread-safe. Single owner.
//------------------------------------------------------------------------------
template <SinkConcept Sink>
class Writer {
public:
    explicit Writer(Sink sink) : sink_(std::move(sink)) {}

    // Forwards to the sink. Returns the number of bytes it accepted.
    std::size_t write(bytes b) {
        const std::size_t written = sink_.write(b.data(), b.size());
        position_ += written;
        return written;
    }

    // Writes all of `b`, retrying short writes until the sink stops making
    // progress.
    [[nodiscard]] Error write_all(bytes b) {
        while (!b.empty()) {
            const std::size_t written = write(b);
            if (written == 0) {
                PK_WARN("[!!] Writer: sink accepted 0 bytes at position " << position_
                        << " (" << b.size() << " bytes pending)");
                return Error::WriteFailed;
            }
            b = b.subspan(written);
        }
        return Error::None;
    }

    template <Pod T>
    [[nodiscard]] Error write_value(const T& value) {
        return write_all(podkit::as_bytes(value));
    }

    // Pads with zero bytes up to the next multiple of `align` (a power of
    // two). Returns the number of padding bytes written: 0 when already
    // aligned, less than required only if the sink failed.
    std::size_t align_to(std::size_t align) {
        PK_REQUIRE(is_power_of_two(align), "Writer::align_to: align is not a power of two");

        static constexpr std::array<std::uint8_t, config::padding_chunk> zeros{};

        std::size_t remaining = padding_for(position_, align);
        std::size_t total = 0;
        while (remaining > 0) {
            const std::size_t chunk = remaining < zeros.size() ? remaining : zeros.size();
            const std::size_t before = position_;
            if (write_all(bytes(zeros.data(), chunk)) != Error::None) {
                total += position_ - before;
                break;
            }
            total += chunk;
            remaining -= chunk;
        }
        return total;
    }

    template <typename T>
    std::size_t align_to_type() {
        return align_to(alignof(T));
    }

    [[nodiscard]] Error flush() {
        return sink_.flush() ? Error::None : Error::WriteFailed;
    }

    // Total bytes accepted by the sink since construction.
    [[nodiscard]] inline std::size_t position() const noexcept { return position_; }

    [[nodiscard]] inline bool is_aligned_to(std::size_t align) const noexcept {
        PK_REQUIRE(is_power_of_two(align), "Writer::is_aligned_to: align is not a power of two");
        return (position_ & (align - 1)) == 0;
    }

    [[nodiscard]] inline Sink& inner() noexcept { return sink_; }
    [[nodiscard]] inline const Sink& inner() const noexcept { return sink_; }

    [[nodiscard]] inline Sink into_inner() && { return std::move(sink_); }

private:
    Sink sink_;
    std::size_t position_{0};
};

} // namespace podkit
