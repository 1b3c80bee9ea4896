#pragma once

#include "cbor/core/common.hpp"

#include <cstdint>

namespace cbor::decode {

using byte = cbor::core::byte;
using bytes_view = cbor::core::bytes_view;
using mutable_bytes_view = cbor::core::mutable_bytes_view;

/**
 * @brief CBOR 主类型（引导字节高 3 位，RFC 8949 §3.1）。
 *
 * 引导字节布局：
 * - 高 3 位：major_type
 * - 低 5 位：附加信息（additional information），决定参数的位置/宽度
 */
enum class major_type : std::uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  float_simple = 7,
};

// 附加信息中的宽度标记：参数紧随引导字节，按大端序占 1/2/4/8 字节。
inline constexpr std::uint8_t kOneByte = 24;
inline constexpr std::uint8_t kTwoBytes = 25;
inline constexpr std::uint8_t kFourBytes = 26;
inline constexpr std::uint8_t kEightBytes = 27;

// 不定长容器的起始标记 / break 停止码（major_type::float_simple 下）。
inline constexpr std::uint8_t kBreak = 31;

// major_type::float_simple 下的固定简单值。
inline constexpr std::uint8_t kFalse = 20;
inline constexpr std::uint8_t kTrue = 21;
inline constexpr std::uint8_t kNull = 22;
inline constexpr std::uint8_t kUndefined = 23;
inline constexpr std::uint8_t kSimpleValue = kOneByte;

inline constexpr std::uint8_t kHalfPrecisionFloat = kTwoBytes;
inline constexpr std::uint8_t kSinglePrecisionFloat = kFourBytes;
inline constexpr std::uint8_t kDoublePrecisionFloat = kEightBytes;

// 长度类读取返回该值表示不定长（以 break 结束）。
inline constexpr std::int64_t kIndefiniteLength = -1;

/**
 * @brief 附加信息的分类（封闭集合，解析器对其做穷举 switch）。
 */
enum class argument_kind : std::uint8_t {
  immediate,    // 0..23：值本身
  one_byte,     // 24
  two_bytes,    // 25
  four_bytes,   // 26
  eight_bytes,  // 27
  indefinite,   // 31
  reserved,     // 28..30：保留，始终非法
};

[[nodiscard]] constexpr major_type major_type_of(byte lead) noexcept {
  return static_cast<major_type>(lead >> 5);
}

[[nodiscard]] constexpr std::uint8_t additional_info_of(byte lead) noexcept {
  return static_cast<std::uint8_t>(lead & 0x1Fu);
}

[[nodiscard]] constexpr byte make_lead_byte(major_type type, std::uint8_t info) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(type) << 5) | (info & 0x1Fu));
}

[[nodiscard]] constexpr argument_kind classify_argument(std::uint8_t info) noexcept {
  if (info < kOneByte) {
    return argument_kind::immediate;
  }
  switch (info) {
    case kOneByte:
      return argument_kind::one_byte;
    case kTwoBytes:
      return argument_kind::two_bytes;
    case kFourBytes:
      return argument_kind::four_bytes;
    case kEightBytes:
      return argument_kind::eight_bytes;
    case kBreak:
      return argument_kind::indefinite;
    default:
      return argument_kind::reserved;
  }
}

/**
 * @brief 参数在引导字节之后占用的字节数（immediate/indefinite/reserved 为 0）。
 */
[[nodiscard]] constexpr std::uint8_t argument_width(argument_kind kind) noexcept {
  switch (kind) {
    case argument_kind::one_byte:
      return 1;
    case argument_kind::two_bytes:
      return 2;
    case argument_kind::four_bytes:
      return 4;
    case argument_kind::eight_bytes:
      return 8;
    case argument_kind::immediate:
    case argument_kind::indefinite:
    case argument_kind::reserved:
      return 0;
  }
  return 0;
}

/**
 * @brief 能容纳 value 的最短参数编码（规范编码）。
 */
[[nodiscard]] constexpr argument_kind minimal_argument_kind(std::uint64_t value) noexcept {
  if (value < kOneByte) {
    return argument_kind::immediate;
  }
  if (value <= 0xFFu) {
    return argument_kind::one_byte;
  }
  if (value <= 0xFFFFu) {
    return argument_kind::two_bytes;
  }
  if (value <= 0xFFFF'FFFFu) {
    return argument_kind::four_bytes;
  }
  return argument_kind::eight_bytes;
}

/**
 * @brief 主类型的可读名称（"unsigned integer"、"text string" 等）。
 */
[[nodiscard]] const char* to_string(major_type type) noexcept;

/**
 * @brief 参数分类的可读名称（"no payload"、"two bytes"、"indefinite" 等）。
 */
[[nodiscard]] const char* to_string(argument_kind kind) noexcept;

[[nodiscard]] inline const char* argument_name(std::uint8_t info) noexcept {
  return to_string(classify_argument(info));
}

}  // namespace cbor::decode
