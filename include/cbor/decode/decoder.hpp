#pragma once

#include "cbor/core/common.hpp"
#include "cbor/decode/types.hpp"
#include "cbor/io/byte_source.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace cbor::decode {

/**
 * @brief 解码内容错误（格式层面）。
 *
 * 字节源耗尽不在此列：统一返回 core::errc::end_of_stream，
 * 以便调用方区分“断流”与“内容损坏”。
 */
enum class errc : int {
  ok = 0,
  unexpected_type = 1,          // 主类型与调用的读取操作不符
  unexpected_subtype = 2,       // 附加信息与要求的宽度/简单值不符
  invalid_additional_info = 3,  // 保留值 28..30，或在不允许处出现 31
  non_canonical = 4,            // 未使用最短宽度编码
  malformed_length = 5,         // 长度无法表示为非负 int64，或要求定长时遇到不定长
  length_overflow = 6,          // 声明长度超过 DecoderOptions::max_string_length
  value_out_of_range = 7,       // 整数超出输出类型范围
  invalid_utf8 = 8,             // 文本串不是合法 UTF-8
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

struct DecoderOptions final {
  // read_byte_string/read_text_string 可物化的最大字节数（分配前检查）。
  std::size_t max_string_length{core::kDefaultMaxStringLength};
};

/**
 * @brief read_integer 可接受的目标类型：除 bool 与字符类型外的整数类型。
 */
template <class T>
inline constexpr bool is_integer_target_v =
    std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool> &&
    !std::is_same_v<std::remove_cv_t<T>, char> && !std::is_same_v<std::remove_cv_t<T>, wchar_t> &&
    !std::is_same_v<std::remove_cv_t<T>, char8_t> && !std::is_same_v<std::remove_cv_t<T>, char16_t> &&
    !std::is_same_v<std::remove_cv_t<T>, char32_t>;

/**
 * @brief 半精度浮点（IEEE-754 binary16 位模式）展开为 double。
 *
 * 保留符号零与符号无穷；指数全 1 且尾数非零时返回 NaN。
 */
[[nodiscard]] double half_to_double(std::uint16_t bits) noexcept;

/**
 * @brief CBOR 流式解码器（单遍、只进、不预读）。
 *
 * 每个 read_* 操作：
 * - 读取恰好一个引导字节并校验主类型/附加信息；
 * - 按需读取参数与载荷，返回一个值；
 * - 失败时返回 error_code，游标位置此后不再可信，调用方应放弃整条消息。
 *
 * 不定长容器：长度类读取返回 kIndefiniteLength，调用方逐个读取元素直到
 * read_break() 成功。树形组装（数组/映射嵌套）由调用方自行完成。
 *
 * 注意：
 * - 解码器不拥有 source，调用方保证其生命周期长于解码器；
 * - 不做线程安全保证。
 */
class Decoder final {
 public:
  explicit Decoder(io::ByteSource& source, DecoderOptions options = {}) noexcept;

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  // 容器/字符串长度前导：返回元素数/字节数，不定长返回 kIndefiniteLength。
  std::error_code read_array_length(std::int64_t& out) noexcept;
  std::error_code read_map_length(std::int64_t& out) noexcept;
  std::error_code read_byte_string_length(std::int64_t& out) noexcept;
  std::error_code read_text_string_length(std::int64_t& out) noexcept;

  // 定长字符串一次性读出；不定长字符串返回 errc::malformed_length。
  std::error_code read_byte_string(std::vector<byte>& out) noexcept;
  std::error_code read_text_string(std::string& out) noexcept;

  /**
   * @brief 通用整数读取：任意（规范）宽度，正负皆可，范围 [INT64_MIN, INT64_MAX]。
   */
  std::error_code read_int(std::int64_t& out) noexcept;

  /**
   * @brief 无符号整数读取（仅主类型 0），覆盖完整 uint64 范围。
   */
  std::error_code read_uint(std::uint64_t& out) noexcept;

  /**
   * @brief 通用整数读取并收窄到 Int（超出范围返回 errc::value_out_of_range）。
   */
  template <class Int>
  std::error_code read_integer(Int& out) noexcept;

  /**
   * @brief 定宽整数读取：引导字节的宽度标记必须与函数名一致。
   *
   * - read_small_int：仅接受内联值，范围 [-24, 23]
   * - read_int8：  1 字节参数，范围 [-256, 255]
   * - read_int16： 2 字节参数，范围 [-65536, 65535]
   * - read_int32： 4 字节参数，范围 [-2^32, 2^32 - 1]
   * - read_int64： 8 字节参数，范围 [INT64_MIN, INT64_MAX]
   *
   * 定宽读取不做最短编码检查（调用方显式指定了宽度）。
   */
  std::error_code read_small_int(std::int32_t& out) noexcept;
  std::error_code read_int8(std::int32_t& out) noexcept;
  std::error_code read_int16(std::int32_t& out) noexcept;
  std::error_code read_int32(std::int64_t& out) noexcept;
  std::error_code read_int64(std::int64_t& out) noexcept;

  std::error_code read_tag(std::uint64_t& out) noexcept;

  std::error_code read_boolean(bool& out) noexcept;
  std::error_code read_null() noexcept;
  std::error_code read_undefined() noexcept;
  std::error_code read_break() noexcept;
  std::error_code read_simple_value(std::uint8_t& out) noexcept;

  std::error_code read_half_float(double& out) noexcept;
  std::error_code read_float(float& out) noexcept;
  std::error_code read_double(double& out) noexcept;

  // 已从字节源取走的字节数（含失败读取中已到达的部分）。
  [[nodiscard]] std::uint64_t bytes_consumed() const noexcept { return consumed_; }
  [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }

 private:
  struct Lead final {
    major_type type{major_type::unsigned_integer};
    std::uint8_t info{0};
  };

  std::error_code pull_byte_(byte& out) noexcept;
  std::error_code pull_exact_(mutable_bytes_view out) noexcept;

  std::error_code next_lead_(Lead& out) noexcept;
  std::error_code expect_major_(major_type expected, Lead& out) noexcept;
  std::error_code expect_exact_(major_type expected, std::uint8_t info) noexcept;
  std::error_code expect_integer_(Lead& out, std::uint64_t& transform) noexcept;

  std::error_code read_be_(std::uint8_t width, std::uint64_t& out) noexcept;
  std::error_code read_argument_(const Lead& lead, std::uint64_t& out) noexcept;
  std::error_code read_canonical_argument_(const Lead& lead, std::uint64_t& out) noexcept;
  std::error_code read_length_(major_type expected, std::int64_t& out) noexcept;
  std::error_code read_fixed_width_(argument_kind expected, std::int64_t& out) noexcept;
  std::error_code check_materializable_(std::int64_t length, std::size_t max_size) noexcept;
  template <class Container>
  std::error_code read_payload_(Container& out, std::size_t length) noexcept;

  // 失败出口：debug 级别开启时才格式化并记录诊断信息。
  std::error_code reject_(std::error_code ec, const char* detail) noexcept;
  template <class... Args>
  std::error_code reject_(std::error_code ec, const char* format, const Args&... args) noexcept;
  void log_rejection_(const std::error_code& ec, std::string_view detail) noexcept;

  io::ByteSource& source_;
  DecoderOptions options_{};

  std::uint64_t consumed_{0};

  // 诊断上下文：当前操作名与其引导字节位置（仅用于日志）。
  const char* op_{""};
  std::uint64_t lead_offset_{0};
  int lead_byte_{-1};
};

template <class Int>
std::error_code Decoder::read_integer(Int& out) noexcept {
  static_assert(is_integer_target_v<Int>,
                "read_integer requires a signed or unsigned integer type (not bool or a character type)");

  if constexpr (std::is_signed_v<Int>) {
    std::int64_t v = 0;
    auto ec = read_int(v);
    if (ec) {
      return ec;
    }
    if (!std::in_range<Int>(v)) {
      return reject_(make_error_code(errc::value_out_of_range), "value does not fit the requested type");
    }
    out = static_cast<Int>(v);
  } else {
    std::uint64_t v = 0;
    auto ec = read_uint(v);
    if (ec) {
      return ec;
    }
    if (!std::in_range<Int>(v)) {
      return reject_(make_error_code(errc::value_out_of_range), "value does not fit the requested type");
    }
    out = static_cast<Int>(v);
  }
  return {};
}

}  // namespace cbor::decode

namespace std {
template <>
struct is_error_code_enum<cbor::decode::errc> : true_type {};
}  // namespace std
