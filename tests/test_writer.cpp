#include <array>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "podkit/writer.hpp"
#include "podkit/sink.hpp"
#include "podkit/pod.hpp"
#include "podkit/align.hpp"

#include "common/test_check.hpp"

/*
================================================================================
Writer — Unit Tests
================================================================================

Validates:
  • zero padding up to the requested alignment, based on bytes written
  • align_to() on an aligned position writes nothing
  • short writes are retried; a sink that stops accepting is WriteFailed
  • ostream_sink reports stream failures
  • written sections can be viewed back in place
================================================================================
*/

namespace {

// Accepts at most `chunk` bytes per call, and nothing after `limit` total.
class trickle_sink {
public:
    trickle_sink(std::size_t chunk, std::size_t limit) : chunk_(chunk), limit_(limit) {}

    std::size_t write(const std::uint8_t* data, std::size_t size) {
        std::size_t n = size < chunk_ ? size : chunk_;
        if (data_.size() + n > limit_) {
            n = limit_ - data_.size();
        }
        data_.insert(data_.end(), data, data + n);
        ++calls_;
        return n;
    }

    bool flush() { return flushes_++ == 0; }

    const std::vector<std::uint8_t>& data() const { return data_; }
    std::size_t calls() const { return calls_; }

private:
    std::size_t chunk_;
    std::size_t limit_;
    std::vector<std::uint8_t> data_;
    std::size_t calls_{0};
    std::size_t flushes_{0};
};

static_assert(podkit::SinkConcept<trickle_sink>);

std::uint16_t u16_ne(std::uint8_t a, std::uint8_t b) {
    const std::uint8_t raw[2] = {a, b};
    std::uint16_t v;
    std::memcpy(&v, raw, sizeof(v));
    return v;
}

std::uint32_t u32_ne(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) {
    const std::uint8_t raw[4] = {a, b, c, d};
    std::uint32_t v;
    std::memcpy(&v, raw, sizeof(v));
    return v;
}

} // namespace

// ------------------------------------------------------------
// Padding
// ------------------------------------------------------------

void test_header_records_padding() {
    std::cout << "[TEST] u16 + align(4) + u32[2] + align(32)..." << std::endl;

    podkit::Writer writer{podkit::vector_sink{}};

    const std::uint16_t num = u16_ne(0x0, 0x1);
    TEST_CHECK(writer.write_value(num) == podkit::Error::None);

    TEST_CHECK_EQ(writer.align_to_type<std::uint32_t>(), 2u);

    const std::array<std::uint32_t, 2> nums{u32_ne(0x2, 0x3, 0x4, 0x5), u32_ne(0x6, 0x7, 0x8, 0x9)};
    TEST_CHECK(writer.write_all(podkit::as_bytes(nums)) == podkit::Error::None);
    TEST_CHECK_EQ(writer.position(), 12u);

    TEST_CHECK_EQ(writer.align_to(32), 20u);
    TEST_CHECK(writer.is_aligned_to(32));

    const std::vector<std::uint8_t> buffer = std::move(writer).into_inner().take();
    const std::vector<std::uint8_t> expected{
        0x0, 0x1, 0x0, 0x0, 0x2, 0x3, 0x4, 0x5, 0x6, 0x7, 0x8, 0x9, 0x0, 0x0, 0x0, 0x0,
        0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0, 0x0};
    TEST_CHECK(buffer == expected);

    std::cout << "[TEST] OK\n";
}

void test_align_is_idempotent() {
    std::cout << "[TEST] align_to() on an aligned position writes nothing..." << std::endl;

    podkit::Writer writer{podkit::vector_sink{}};
    TEST_CHECK_EQ(writer.align_to(64), 0u);      // position 0 is aligned to anything
    TEST_CHECK_EQ(writer.position(), 0u);

    TEST_CHECK(writer.write_value(std::uint8_t{1}) == podkit::Error::None);
    TEST_CHECK_EQ(writer.align_to(64), 63u);     // larger than one padding chunk
    TEST_CHECK_EQ(writer.align_to(64), 0u);
    TEST_CHECK_EQ(writer.align_to(1), 0u);
    TEST_CHECK_EQ(writer.inner().data().size(), 64u);

    std::cout << "[TEST] OK\n";
}

void test_position_counts_from_construction() {
    std::cout << "[TEST] alignment is relative to bytes written, not sink contents..." << std::endl;

    // a sink that already holds 3 bytes
    podkit::Writer writer{podkit::vector_sink{std::vector<std::uint8_t>{9, 9, 9}}};
    TEST_CHECK_EQ(writer.position(), 0u);
    TEST_CHECK_EQ(writer.align_to(4), 0u);
    TEST_CHECK(writer.write_value(std::uint8_t{7}) == podkit::Error::None);
    TEST_CHECK_EQ(writer.align_to(4), 3u);
    TEST_CHECK_EQ(writer.inner().data().size(), 3u + 4u);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Short writes / failures
// ------------------------------------------------------------

void test_short_writes_are_retried() {
    std::cout << "[TEST] write_all() retries short writes..." << std::endl;

    podkit::Writer writer{trickle_sink{3, 1000}};
    const std::vector<std::uint8_t> payload{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    TEST_CHECK(writer.write_all(payload) == podkit::Error::None);
    TEST_CHECK_EQ(writer.position(), 10u);
    TEST_CHECK_EQ(writer.inner().calls(), 4u);
    TEST_CHECK(writer.inner().data() == payload);

    // plain write() forwards once and reports what was accepted
    TEST_CHECK_EQ(writer.write(payload), 3u);
    TEST_CHECK_EQ(writer.position(), 13u);

    std::cout << "[TEST] OK\n";
}

void test_stalled_sink_is_write_failed() {
    std::cout << "[TEST] stalled sink yields WriteFailed..." << std::endl;

    podkit::Writer writer{trickle_sink{4, 6}};
    const std::vector<std::uint8_t> payload{1, 2, 3, 4, 5, 6, 7, 8};

    TEST_CHECK(writer.write_all(payload) == podkit::Error::WriteFailed);
    TEST_CHECK_EQ(writer.position(), 6u);

    // padding stops at the failure and reports what was written
    podkit::Writer pad_writer{trickle_sink{16, 5}};
    TEST_CHECK(pad_writer.write_value(std::uint8_t{1}) == podkit::Error::None);
    TEST_CHECK_EQ(pad_writer.align_to(32), 4u);
    TEST_CHECK_EQ(pad_writer.position(), 5u);

    TEST_CHECK(pad_writer.flush() == podkit::Error::None);
    TEST_CHECK(pad_writer.flush() == podkit::Error::WriteFailed);

    std::cout << "[TEST] OK\n";
}

void test_ostream_sink() {
    std::cout << "[TEST] ostream_sink..." << std::endl;

    std::ostringstream oss;
    podkit::Writer writer{podkit::ostream_sink{oss}};

    const std::array<std::uint8_t, 3> abc{'a', 'b', 'c'};
    TEST_CHECK(writer.write_all(abc) == podkit::Error::None);
    TEST_CHECK_EQ(writer.align_to(4), 1u);
    TEST_CHECK(writer.flush() == podkit::Error::None);
    TEST_CHECK_EQ(oss.str(), std::string("abc\0", 4));

    oss.setstate(std::ios::badbit);
    TEST_CHECK(writer.write_all(abc) == podkit::Error::WriteFailed);
    TEST_CHECK(writer.flush() == podkit::Error::WriteFailed);
    TEST_CHECK_EQ(writer.position(), 4u);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Write, then view in place
// ------------------------------------------------------------

void test_written_sections_view_back() {
    std::cout << "[TEST] written sections view back in place..." << std::endl;

    podkit::Writer writer{podkit::vector_sink{}};
    const std::uint8_t tag = 0xEE;
    const std::array<std::uint64_t, 3> values{10, 20, 30};

    TEST_CHECK(writer.write_value(tag) == podkit::Error::None);
    TEST_CHECK_EQ(writer.align_to_type<std::uint64_t>(), 7u);
    TEST_CHECK(writer.write_all(podkit::as_bytes(values)) == podkit::Error::None);

    const std::vector<std::uint8_t> raw = std::move(writer).into_inner().take();

    // vector storage from operator new is aligned for std::uint64_t
    const podkit::bytes data(raw);
    auto head = podkit::view_one_prefix<std::uint8_t>(data);
    TEST_CHECK(head.has_value());
    TEST_CHECK_EQ(*head->value, tag);

    auto aligned = podkit::align_to_type<std::uint64_t>(head->rest);
    TEST_CHECK(aligned.has_value());
    TEST_CHECK_EQ(aligned->prefix.size(), 7u);

    auto items = podkit::view_slice<std::uint64_t>(aligned->suffix);
    TEST_CHECK(items.has_value());
    TEST_CHECK_EQ(items->size(), 3u);
    TEST_CHECK_EQ((*items)[2], 30u);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_header_records_padding();
    test_align_is_idempotent();
    test_position_counts_from_construction();
    test_short_writes_are_retried();
    test_stalled_sink_is_write_failed();
    test_ostream_sink();
    test_written_sections_view_back();

    std::cout << "[TEST] ALL WRITER TESTS PASSED!\n";
    return 0;
}
