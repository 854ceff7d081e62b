#include <cstdint>
#include <cstring>
#include <iostream>

#include "podkit/align.hpp"
#include "podkit/numbers.hpp"
#include "podkit/pod.hpp"

#include "common/test_check.hpp"

/*
================================================================================
Alignment helpers — Unit Tests
================================================================================

Validates:
  • is_aligned_to() inspects the address of the first byte
  • align_to() splits into padding + aligned suffix, or reports absence when
    the buffer is shorter than the padding
  • padding_for() matches the writer's padding rule
================================================================================
*/

void test_is_aligned_to() {
    std::cout << "[TEST] is_aligned_to()..." << std::endl;

    alignas(16) const std::uint8_t buf[32] = {};
    const podkit::bytes all(buf, sizeof(buf));

    TEST_CHECK(podkit::is_aligned_to(all, 1));
    TEST_CHECK(podkit::is_aligned_to(all, 8));
    TEST_CHECK(podkit::is_aligned_to(all, 16));
    TEST_CHECK(podkit::is_aligned_to(all.subspan(8), 8));
    TEST_CHECK(!podkit::is_aligned_to(all.subspan(8), 16));
    TEST_CHECK(!podkit::is_aligned_to(all.subspan(3), 2));
    TEST_CHECK(podkit::is_aligned_to(all.subspan(3), 1));

    std::cout << "[TEST] OK\n";
}

void test_align_to_split() {
    std::cout << "[TEST] align_to() prefix/suffix split..." << std::endl;

    alignas(16) const std::uint8_t buf[32] = {};
    const podkit::bytes all(buf, sizeof(buf));

    // already aligned: empty prefix
    auto a = podkit::align_to(all, 8);
    TEST_CHECK(a.has_value());
    TEST_CHECK(a->prefix.empty());
    TEST_CHECK_EQ(a->suffix.size(), 32u);

    // 3 bytes in: 5 bytes of padding to reach 8
    auto b = podkit::align_to(all.subspan(3), 8);
    TEST_CHECK(b.has_value());
    TEST_CHECK_EQ(b->prefix.size(), 5u);
    TEST_CHECK_EQ(b->suffix.size(), 24u);
    TEST_CHECK(b->suffix.data() == buf + 8);
    TEST_CHECK(podkit::is_aligned_to(b->suffix, 8));

    // exactly the padding: empty but present suffix
    auto c = podkit::align_to(all.subspan(3, 5), 8);
    TEST_CHECK(c.has_value());
    TEST_CHECK_EQ(c->prefix.size(), 5u);
    TEST_CHECK(c->suffix.empty());

    // shorter than the padding: absent
    TEST_CHECK(!podkit::align_to(all.subspan(3, 4), 8).has_value());

    std::cout << "[TEST] OK\n";
}

void test_align_to_type() {
    std::cout << "[TEST] align_to_type<T>()..." << std::endl;

    alignas(8) const std::uint8_t buf[16] = {};
    const podkit::bytes all(buf, sizeof(buf));

    auto r = podkit::align_to_type<std::uint32_t>(all.subspan(1));
    TEST_CHECK(r.has_value());
    TEST_CHECK_EQ(r->prefix.size(), 3u);
    TEST_CHECK(r->suffix.data() == buf + 4);

    auto u8 = podkit::align_to_type<std::uint8_t>(all.subspan(5));
    TEST_CHECK(u8.has_value());
    TEST_CHECK(u8->prefix.empty());

    std::cout << "[TEST] OK\n";
}

void test_skip_padding_between_sections() {
    std::cout << "[TEST] u16 prefix, skip padding, u32 slice..." << std::endl;

    alignas(4) const std::uint8_t buf[10] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

    auto head = podkit::view_one_prefix<std::uint16_t>(podkit::bytes(buf, sizeof(buf)));
    TEST_CHECK(head.has_value());

    auto aligned = podkit::align_to(head->rest, sizeof(std::uint32_t));
    TEST_CHECK(aligned.has_value());
    TEST_CHECK_EQ(aligned->prefix.size(), 2u);

    auto nums = podkit::view_slice_prefix<std::uint32_t>(aligned->suffix, 1);
    TEST_CHECK(nums.has_value());
    std::uint32_t expected;
    std::memcpy(&expected, buf + 4, sizeof(expected));
    TEST_CHECK_EQ(nums->items[0], expected);
    TEST_CHECK_EQ(nums->rest.size(), 2u);
    TEST_CHECK_EQ(nums->rest[0], 8);

    std::cout << "[TEST] OK\n";
}

void test_padding_for() {
    std::cout << "[TEST] padding_for() / is_power_of_two()..." << std::endl;

    static_assert(podkit::padding_for(0, 8) == 0);
    static_assert(podkit::padding_for(12, 8) == 4);
    static_assert(podkit::padding_for(16, 8) == 0);
    static_assert(podkit::padding_for(17, 16) == 15);
    static_assert(podkit::padding_for(5, 1) == 0);

    for (std::size_t align = 1; align <= 64; align <<= 1) {
        for (std::size_t pos = 0; pos < 200; ++pos) {
            const std::size_t pad = podkit::padding_for(pos, align);
            TEST_CHECK(pad < align);
            TEST_CHECK_EQ((pos + pad) % align, 0u);
        }
    }

    static_assert(podkit::is_power_of_two(1));
    static_assert(podkit::is_power_of_two(64));
    static_assert(!podkit::is_power_of_two(0));
    static_assert(!podkit::is_power_of_two(12));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_is_aligned_to();
    test_align_to_split();
    test_align_to_type();
    test_skip_padding_between_sections();
    test_padding_for();

    std::cout << "[TEST] ALL ALIGN TESTS PASSED!\n";
    return 0;
}
