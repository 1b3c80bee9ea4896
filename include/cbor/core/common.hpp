#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cbor::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 字符串类读取的默认上限（在分配内存之前检查声明长度）。
inline constexpr std::size_t kDefaultMaxStringLength = 64 * 1024 * 1024;  // 64MB

}  // 命名空间 cbor::core
