#include "cbor/io/byte_source.hpp"

#include "cbor/core/error.hpp"

#include <algorithm>

namespace cbor::io {

std::error_code MemorySource::read_byte(core::byte& out) noexcept {
  if (pos_ >= in_.size()) {
    return core::make_error_code(core::errc::end_of_stream);
  }
  out = in_[pos_++];
  return {};
}

std::error_code MemorySource::read_exact(core::mutable_bytes_view out,
                                         std::size_t& transferred) noexcept {
  // 不足时先把剩余字节拷走再报错，与流式字节源的“已读即消耗”语义一致。
  const auto n = std::min(out.size(), remaining());
  std::copy_n(in_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
  pos_ += n;
  transferred = n;
  if (n < out.size()) {
    return core::make_error_code(core::errc::end_of_stream);
  }
  return {};
}

}  // namespace cbor::io
