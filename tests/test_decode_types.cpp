#include "cbor/decode/types.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string_view>

namespace {

using cbor::decode::argument_kind;
using cbor::decode::argument_name;
using cbor::decode::argument_width;
using cbor::decode::classify_argument;
using cbor::decode::major_type;
using cbor::decode::major_type_of;
using cbor::decode::additional_info_of;
using cbor::decode::make_lead_byte;
using cbor::decode::minimal_argument_kind;

void test_major_type_from_top_three_bits() {
  TEST_EXPECT_EQ(major_type_of(0x00), major_type::unsigned_integer);
  TEST_EXPECT_EQ(major_type_of(0x1B), major_type::unsigned_integer);
  TEST_EXPECT_EQ(major_type_of(0x20), major_type::negative_integer);
  TEST_EXPECT_EQ(major_type_of(0x5F), major_type::byte_string);
  TEST_EXPECT_EQ(major_type_of(0x60), major_type::text_string);
  TEST_EXPECT_EQ(major_type_of(0x9F), major_type::array);
  TEST_EXPECT_EQ(major_type_of(0xA0), major_type::map);
  TEST_EXPECT_EQ(major_type_of(0xC1), major_type::tag);
  TEST_EXPECT_EQ(major_type_of(0xFF), major_type::float_simple);

  // 每个 3 位模式恰好对应一个主类型
  for (unsigned b = 0; b < 256; ++b) {
    TEST_EXPECT_EQ(static_cast<unsigned>(major_type_of(static_cast<std::uint8_t>(b))), b >> 5);
  }
}

void test_additional_info_and_lead_byte() {
  TEST_EXPECT_EQ(additional_info_of(0xF9), 25u);
  TEST_EXPECT_EQ(additional_info_of(0x7F), 31u);
  TEST_EXPECT_EQ(make_lead_byte(major_type::float_simple, 31), 0xFFu);
  TEST_EXPECT_EQ(make_lead_byte(major_type::negative_integer, 27), 0x3Bu);
  TEST_EXPECT_EQ(make_lead_byte(major_type::text_string, 0), 0x60u);
}

void test_classify_argument() {
  for (std::uint8_t info = 0; info < 24; ++info) {
    TEST_EXPECT_EQ(classify_argument(info), argument_kind::immediate);
  }
  TEST_EXPECT_EQ(classify_argument(24), argument_kind::one_byte);
  TEST_EXPECT_EQ(classify_argument(25), argument_kind::two_bytes);
  TEST_EXPECT_EQ(classify_argument(26), argument_kind::four_bytes);
  TEST_EXPECT_EQ(classify_argument(27), argument_kind::eight_bytes);
  TEST_EXPECT_EQ(classify_argument(28), argument_kind::reserved);
  TEST_EXPECT_EQ(classify_argument(29), argument_kind::reserved);
  TEST_EXPECT_EQ(classify_argument(30), argument_kind::reserved);
  TEST_EXPECT_EQ(classify_argument(31), argument_kind::indefinite);

  TEST_EXPECT_EQ(argument_width(argument_kind::immediate), 0u);
  TEST_EXPECT_EQ(argument_width(argument_kind::one_byte), 1u);
  TEST_EXPECT_EQ(argument_width(argument_kind::two_bytes), 2u);
  TEST_EXPECT_EQ(argument_width(argument_kind::four_bytes), 4u);
  TEST_EXPECT_EQ(argument_width(argument_kind::eight_bytes), 8u);
  TEST_EXPECT_EQ(argument_width(argument_kind::indefinite), 0u);
}

void test_minimal_argument_kind_boundaries() {
  TEST_EXPECT_EQ(minimal_argument_kind(0), argument_kind::immediate);
  TEST_EXPECT_EQ(minimal_argument_kind(23), argument_kind::immediate);
  TEST_EXPECT_EQ(minimal_argument_kind(24), argument_kind::one_byte);
  TEST_EXPECT_EQ(minimal_argument_kind(0xFF), argument_kind::one_byte);
  TEST_EXPECT_EQ(minimal_argument_kind(0x100), argument_kind::two_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(500), argument_kind::two_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(0xFFFF), argument_kind::two_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(0x10000), argument_kind::four_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(0xFFFF'FFFFull), argument_kind::four_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(0x1'0000'0000ull), argument_kind::eight_bytes);
  TEST_EXPECT_EQ(minimal_argument_kind(~0ull), argument_kind::eight_bytes);
}

void test_names() {
  TEST_EXPECT_EQ(std::string_view(to_string(major_type::unsigned_integer)), "unsigned integer");
  TEST_EXPECT_EQ(std::string_view(to_string(major_type::negative_integer)), "negative integer");
  TEST_EXPECT_EQ(std::string_view(to_string(major_type::text_string)), "text string");
  TEST_EXPECT_EQ(std::string_view(to_string(major_type::float_simple)), "float/simple value");

  TEST_EXPECT_EQ(std::string_view(argument_name(5)), "no payload");
  TEST_EXPECT_EQ(std::string_view(argument_name(24)), "one byte");
  TEST_EXPECT_EQ(std::string_view(argument_name(25)), "two bytes");
  TEST_EXPECT_EQ(std::string_view(argument_name(26)), "four bytes");
  TEST_EXPECT_EQ(std::string_view(argument_name(27)), "eight bytes");
  TEST_EXPECT_EQ(std::string_view(argument_name(29)), "reserved");
  TEST_EXPECT_EQ(std::string_view(argument_name(31)), "indefinite");
}

}  // namespace

int main() {
  test_major_type_from_top_three_bits();
  test_additional_info_and_lead_byte();
  test_classify_argument();
  test_minimal_argument_kind_boundaries();
  test_names();
  return ::cbor::tests::run_and_report();
}
