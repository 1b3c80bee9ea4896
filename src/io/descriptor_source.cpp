#include "cbor/io/descriptor_source.hpp"

#include "cbor/core/error.hpp"
#include "core/logger.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>

namespace cbor::io {

DescriptorSource::DescriptorSource(const asio::any_io_executor& ex) : sd_(ex) {}

std::error_code DescriptorSource::assign(int fd) noexcept {
  if (fd < 0) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  if (sd_.is_open()) {
    close();
  }
  std::error_code ec;
  sd_.assign(fd, ec);
  if (ec) {
    core::logger().debug("descriptor source: assign fd={} failed: {}", fd, ec.message());
    return ec;
  }
  consumed_ = 0;
  core::logger().trace("descriptor source: fd={} opened", fd);
  return {};
}

bool DescriptorSource::is_open() const noexcept { return sd_.is_open(); }

void DescriptorSource::close() noexcept {
  if (!sd_.is_open()) {
    return;
  }
  std::error_code ignored;
  sd_.close(ignored);
  core::logger().trace("descriptor source: closed after {} bytes", consumed_);
}

std::error_code DescriptorSource::read_byte(core::byte& out) noexcept {
  std::size_t n = 0;
  return read_exact(core::mutable_bytes_view{&out, 1}, n);
}

std::error_code DescriptorSource::read_exact(core::mutable_bytes_view out,
                                             std::size_t& transferred) noexcept {
  transferred = 0;
  if (out.empty()) {
    return {};
  }
  if (!sd_.is_open()) {
    return asio::error::bad_descriptor;
  }

  std::error_code ec;
  // asio::read 会循环读取直到填满缓冲区或出错；出错时 n 为已读到的字节数。
  const auto n = asio::read(sd_, asio::buffer(out.data(), out.size()), ec);
  consumed_ += n;
  transferred = n;
  if (ec == asio::error::eof) {
    return core::make_error_code(core::errc::end_of_stream);
  }
  if (ec) {
    core::logger().debug("descriptor source: read failed after {} bytes: {}", consumed_, ec.message());
    return ec;
  }
  return {};
}

}  // namespace cbor::io
