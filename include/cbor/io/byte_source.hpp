#pragma once

#include "cbor/core/common.hpp"

#include <cstddef>
#include <system_error>

namespace cbor::io {

/**
 * @brief 顺序、只进的字节源抽象（解码器唯一的输入来源）。
 *
 * 约定：
 * - 读取是阻塞的：要么拿到请求的字节，要么返回错误；
 * - 字节源耗尽时返回 core::errc::end_of_stream，其余 I/O 失败原样返回；
 * - 不支持回退/窥视；同一实例不做线程安全保证。
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  /**
   * @brief 读取 1 个字节。
   */
  virtual std::error_code read_byte(core::byte& out) noexcept = 0;

  /**
   * @brief 读满 out.size() 个字节。
   *
   * transferred 为实际写入 out 的字节数（成功时等于 out.size()）。
   * 字节不足时返回 core::errc::end_of_stream；此时已读到的字节同样被消耗
   * （游标不会回退），并计入 transferred。
   */
  virtual std::error_code read_exact(core::mutable_bytes_view out,
                                     std::size_t& transferred) noexcept = 0;
};

/**
 * @brief 基于内存缓冲区的字节源（不拥有数据，调用方保证 in 的生命周期）。
 */
class MemorySource final : public ByteSource {
 public:
  explicit MemorySource(core::bytes_view in) noexcept : in_(in) {}

  std::error_code read_byte(core::byte& out) noexcept override;
  std::error_code read_exact(core::mutable_bytes_view out, std::size_t& transferred) noexcept override;

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }

 private:
  core::bytes_view in_{};
  std::size_t pos_{0};
};

}  // namespace cbor::io
