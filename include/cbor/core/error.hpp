#pragma once

#include <system_error>

namespace cbor::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有读取接口返回 std::error_code，不抛异常。
 * - end_of_stream 专门表示“字节源已耗尽”，与内容格式错误（cbor::decode::errc）
 *   严格区分：调用方可能需要区分“消息中途断流”和“完整但损坏的消息”。
 */
enum class errc : int {
  ok = 0,
  end_of_stream = 1,
  invalid_argument = 2,
  out_of_memory = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace cbor::core

namespace std {
template <>
struct is_error_code_enum<cbor::core::errc> : true_type {};
}  // namespace std
