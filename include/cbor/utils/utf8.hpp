#pragma once

#include "cbor/core/common.hpp"

#include <cstddef>

namespace cbor::utils {

/**
 * @brief 严格校验 UTF-8（RFC 3629）。
 *
 * 拒绝：孤立的续字节、截断的多字节序列、过长编码（overlong）、
 * 代理区 U+D800..U+DFFF、超过 U+10FFFF 的码点。
 *
 * 返回 false 时 error_offset 为首个非法序列的起始偏移。
 */
[[nodiscard]] bool validate_utf8(cbor::core::bytes_view bytes,
                                 std::size_t &error_offset) noexcept;

} // namespace cbor::utils
