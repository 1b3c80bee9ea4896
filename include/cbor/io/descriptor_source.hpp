#pragma once

#include "cbor/io/byte_source.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <system_error>

namespace cbor::io {

/**
 * @brief 基于 POSIX 文件描述符（pipe/socket/文件）的阻塞字节源。
 *
 * 说明：
 * - 使用 asio::posix::stream_descriptor + 同步 asio::read，不需要运行 io_context；
 * - assign() 之后描述符归本对象所有，析构/close() 时关闭；
 * - 对端关闭（asio::error::eof）映射为 core::errc::end_of_stream；
 * - 调用方若需中止正在进行的解码，可 close() 字节源，后续读取会失败。
 *
 * 注意：不做线程安全保证；一个描述符对应一个 Decoder。
 */
class DescriptorSource final : public ByteSource {
 public:
  explicit DescriptorSource(const asio::any_io_executor& ex);

  DescriptorSource(const DescriptorSource&) = delete;
  DescriptorSource& operator=(const DescriptorSource&) = delete;

  std::error_code assign(int fd) noexcept;
  [[nodiscard]] bool is_open() const noexcept;
  void close() noexcept;

  std::error_code read_byte(core::byte& out) noexcept override;
  std::error_code read_exact(core::mutable_bytes_view out, std::size_t& transferred) noexcept override;

  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

 private:
  asio::posix::stream_descriptor sd_;
  std::size_t consumed_{0};
};

}  // namespace cbor::io
