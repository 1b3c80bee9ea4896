#pragma once

#include "cbor/core/common.hpp"
#include "cbor/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cbor::utils {

/**
 * @brief 将 bytes 格式化为单行 16 进制（"1b 00 ff"），用于日志与测试输出。
 *
 * max_bytes 为 0 表示不限制；超出部分以 " ..." 结尾。
 */
[[nodiscard]] std::string to_hex(cbor::core::bytes_view bytes,
                                 std::size_t max_bytes = 0);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 典型用途：直接粘贴 RFC 8949 附录 A 中的 “0x1bffffffffffffffff” 之类示例。
 *
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<cbor::core::byte> &out) noexcept;

} // namespace cbor::utils
