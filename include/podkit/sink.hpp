/*
===============================================================================
SinkConcept
===============================================================================

Minimal output contract required by podkit::Writer.

  • write(data, size) returns the number of bytes accepted. Fewer than `size`
    (including 0) signals a short write; the writer never masks it.
  • flush() returns false if buffered bytes could not be delivered.

Sinks are plain values owned by the writer. No dynamic dispatch.
===============================================================================
*/
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>


namespace podkit {

template <class S>
concept SinkConcept =
    requires(S s, const std::uint8_t* data, std::size_t size)
{
    { s.write(data, size) } -> std::same_as<std::size_t>;
    { s.flush() } -> std::same_as<bool>;
};


// -----------------------------------------------------------------------------
// In-memory sink (owns its bytes)
// -----------------------------------------------------------------------------
class vector_sink {
public:
    vector_sink() = default;
    explicit vector_sink(std::vector<std::uint8_t> initial) : data_(std::move(initial)) {}

    inline std::size_t write(const std::uint8_t* data, std::size_t size) {
        data_.insert(data_.end(), data, data + size);
        return size;
    }

    inline bool flush() noexcept { return true; }

    [[nodiscard]] inline const std::vector<std::uint8_t>& data() const noexcept { return data_; }

    [[nodiscard]] inline std::vector<std::uint8_t> take() && noexcept { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};


// -----------------------------------------------------------------------------
// std::ostream sink (borrows the stream; caller keeps it alive)
// -----------------------------------------------------------------------------
// std::ostream does not report partial writes, so a failed write is
// reported as 0 bytes accepted.
class ostream_sink {
public:
    explicit ostream_sink(std::ostream& os) noexcept : os_(&os) {}

    inline std::size_t write(const std::uint8_t* data, std::size_t size) {
        if (!os_->good()) {
            return 0;
        }
        os_->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        return os_->good() ? size : 0;
    }

    inline bool flush() {
        os_->flush();
        return os_->good();
    }

    [[nodiscard]] inline std::ostream& stream() const noexcept { return *os_; }

private:
    std::ostream* os_;
};

static_assert(SinkConcept<vector_sink>);
static_assert(SinkConcept<ostream_sink>);

} // namespace podkit
