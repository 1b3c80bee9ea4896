#include "cbor/core/error.hpp"
#include "cbor/io/byte_source.hpp"

#include "test_main.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace {

using cbor::core::byte;
using cbor::core::errc;
using cbor::core::mutable_bytes_view;
using cbor::io::MemorySource;

void test_read_byte_until_exhausted() {
  const std::array<byte, 2> in{0xA1, 0xFF};
  MemorySource src(in);
  TEST_EXPECT_EQ(src.remaining(), 2u);

  byte b = 0;
  TEST_EXPECT_OK(src.read_byte(b));
  TEST_EXPECT_EQ(b, byte{0xA1});
  TEST_EXPECT_OK(src.read_byte(b));
  TEST_EXPECT_EQ(b, byte{0xFF});
  TEST_EXPECT_EQ(src.consumed(), 2u);

  TEST_EXPECT_EQ(src.read_byte(b), errc::end_of_stream);
  TEST_EXPECT_EQ(src.consumed(), 2u);
}

void test_read_exact() {
  const std::array<byte, 5> in{1, 2, 3, 4, 5};
  MemorySource src(in);

  std::array<byte, 3> out{};
  std::size_t n = 0;
  TEST_EXPECT_OK(src.read_exact(mutable_bytes_view{out}, n));
  TEST_EXPECT_EQ(n, 3u);
  TEST_EXPECT_EQ(out[0], byte{1});
  TEST_EXPECT_EQ(out[2], byte{3});
  TEST_EXPECT_EQ(src.remaining(), 2u);

  // 空读取总是成功且不移动游标
  TEST_EXPECT_OK(src.read_exact(mutable_bytes_view{}, n));
  TEST_EXPECT_EQ(n, 0u);
  TEST_EXPECT_EQ(src.consumed(), 3u);
}

void test_short_read_consumes_what_is_available() {
  const std::array<byte, 2> in{0xAA, 0xBB};
  MemorySource src(in);

  std::array<byte, 4> out{};
  std::size_t n = 0;
  TEST_EXPECT_EQ(src.read_exact(mutable_bytes_view{out}, n), errc::end_of_stream);
  TEST_EXPECT_EQ(n, 2u);
  TEST_EXPECT_EQ(src.consumed(), 2u);
  TEST_EXPECT_EQ(src.remaining(), 0u);
  TEST_EXPECT_EQ(out[0], byte{0xAA});
  TEST_EXPECT_EQ(out[1], byte{0xBB});
}

void test_empty_source() {
  MemorySource src(cbor::core::bytes_view{});
  byte b = 0;
  TEST_EXPECT_EQ(src.read_byte(b), errc::end_of_stream);
}

}  // namespace

int main() {
  test_read_byte_until_exhausted();
  test_read_exact();
  test_short_read_consumes_what_is_available();
  test_empty_source();
  return ::cbor::tests::run_and_report();
}
