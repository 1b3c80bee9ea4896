#include "cbor/decode/decoder.hpp"

#include "cbor/core/error.hpp"
#include "cbor/utils/hex.hpp"
#include "cbor/utils/utf8.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <limits>
#include <new>
#include <stdexcept>

namespace cbor::decode {
namespace {

class cbor_decode_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cbor.decode"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_type:
        return "unexpected cbor major type";
      case errc::unexpected_subtype:
        return "unexpected cbor subtype";
      case errc::invalid_additional_info:
        return "invalid cbor additional information";
      case errc::non_canonical:
        return "non-canonical cbor encoding";
      case errc::malformed_length:
        return "malformed cbor length";
      case errc::length_overflow:
        return "cbor length exceeds limit";
      case errc::value_out_of_range:
        return "cbor integer out of range";
      case errc::invalid_utf8:
        return "invalid utf-8 in cbor text string";
      default:
        return "unknown cbor.decode error";
    }
  }
};

constexpr auto kInt64Max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

// 字符串载荷按块增长缓冲区：内存占用跟随实际到达的字节，而非声明长度。
constexpr std::size_t kPayloadChunk = 64 * 1024;

// 负整数在线上存储的是 -1 - v，即 v 的按位取反；
// 无符号整数 transform 为 0，负整数为全 1，统一用 XOR 还原。
constexpr std::uint64_t sign_transform(major_type type) noexcept {
  return type == major_type::negative_integer ? ~std::uint64_t{0} : std::uint64_t{0};
}

}  // namespace

const std::error_category& error_category() noexcept {
  static cbor_decode_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

double half_to_double(std::uint16_t bits) noexcept {
  const int exp = (bits >> 10) & 0x1F;
  const int mant = bits & 0x3FF;

  double val = 0.0;
  if (exp == 0) {
    // 次正规数（含 ±0）
    val = std::ldexp(static_cast<double>(mant), -24);
  } else if (exp != 31) {
    val = std::ldexp(static_cast<double>(mant + 1024), exp - 25);
  } else if (mant != 0) {
    val = std::numeric_limits<double>::quiet_NaN();
  } else {
    val = std::numeric_limits<double>::infinity();
  }

  return (bits & 0x8000u) == 0 ? val : -val;
}

Decoder::Decoder(io::ByteSource& source, DecoderOptions options) noexcept
    : source_(source), options_(options) {}

// ---------------------------------------------------------------------------
// 底层读取与诊断
// ---------------------------------------------------------------------------

void Decoder::log_rejection_(const std::error_code& ec, std::string_view detail) noexcept {
  auto& log = core::logger();
  if (lead_byte_ >= 0) {
    log.debug("{} failed at offset {} (lead 0x{:02x}): {}: {}",
              op_, lead_offset_, lead_byte_, ec.message(), detail);
  } else {
    log.debug("{} failed at offset {}: {}: {}", op_, lead_offset_, ec.message(), detail);
  }
}

std::error_code Decoder::reject_(std::error_code ec, const char* detail) noexcept {
  if (core::logger().should_log(spdlog::level::debug)) {
    log_rejection_(ec, detail);
  }
  return ec;
}

template <class... Args>
std::error_code Decoder::reject_(std::error_code ec, const char* format, const Args&... args) noexcept {
  if (core::logger().should_log(spdlog::level::debug)) {
    log_rejection_(ec, fmt::vformat(format, fmt::make_format_args(args...)));
  }
  return ec;
}

std::error_code Decoder::pull_byte_(byte& out) noexcept {
  auto ec = source_.read_byte(out);
  if (ec) {
    return reject_(ec, "reading one byte");
  }
  ++consumed_;
  return {};
}

std::error_code Decoder::pull_exact_(mutable_bytes_view out) noexcept {
  std::size_t n = 0;
  auto ec = source_.read_exact(out, n);
  consumed_ += n;
  if (ec) {
    return reject_(ec, "reading {} bytes, got {}", out.size(), n);
  }
  return {};
}

std::error_code Decoder::next_lead_(Lead& out) noexcept {
  lead_offset_ = consumed_;
  lead_byte_ = -1;

  byte b = 0;
  auto ec = pull_byte_(b);
  if (ec) {
    return ec;
  }
  lead_byte_ = b;
  out = Lead{major_type_of(b), additional_info_of(b)};
  return {};
}

std::error_code Decoder::expect_major_(major_type expected, Lead& out) noexcept {
  auto ec = next_lead_(out);
  if (ec) {
    return ec;
  }
  if (out.type != expected) {
    return reject_(make_error_code(errc::unexpected_type),
                   "got {}, expected {}", to_string(out.type), to_string(expected));
  }
  return {};
}

std::error_code Decoder::expect_exact_(major_type expected, std::uint8_t info) noexcept {
  Lead lead;
  auto ec = expect_major_(expected, lead);
  if (ec) {
    return ec;
  }
  if (lead.info != info) {
    return reject_(make_error_code(errc::unexpected_subtype),
                   "got subtype {}, expected {}", lead.info, info);
  }
  return {};
}

std::error_code Decoder::expect_integer_(Lead& out, std::uint64_t& transform) noexcept {
  auto ec = next_lead_(out);
  if (ec) {
    return ec;
  }
  if (out.type != major_type::unsigned_integer && out.type != major_type::negative_integer) {
    return reject_(make_error_code(errc::unexpected_type),
                   "got {}, expected {} or {}", to_string(out.type),
                   to_string(major_type::unsigned_integer),
                   to_string(major_type::negative_integer));
  }
  transform = sign_transform(out.type);
  return {};
}

// ---------------------------------------------------------------------------
// 参数/长度解析
// ---------------------------------------------------------------------------

std::error_code Decoder::read_be_(std::uint8_t width, std::uint64_t& out) noexcept {
  std::array<byte, 8> buf{};
  auto ec = pull_exact_(mutable_bytes_view{buf.data(), width});
  if (ec) {
    return ec;
  }
  std::uint64_t v = 0;
  for (std::uint8_t i = 0; i < width; ++i) {
    v = (v << 8) | buf[i];
  }
  out = v;
  return {};
}

std::error_code Decoder::read_argument_(const Lead& lead, std::uint64_t& out) noexcept {
  const auto kind = classify_argument(lead.info);
  switch (kind) {
    case argument_kind::immediate:
      out = lead.info;
      return {};
    case argument_kind::one_byte:
    case argument_kind::two_bytes:
    case argument_kind::four_bytes:
    case argument_kind::eight_bytes:
      return read_be_(argument_width(kind), out);
    case argument_kind::indefinite:
    case argument_kind::reserved:
      break;
  }
  return reject_(make_error_code(errc::invalid_additional_info),
                 "additional information {} ({}) carries no value for {}",
                 lead.info, argument_name(lead.info), to_string(lead.type));
}

std::error_code Decoder::read_canonical_argument_(const Lead& lead, std::uint64_t& out) noexcept {
  std::uint64_t v = 0;
  auto ec = read_argument_(lead, v);
  if (ec) {
    return ec;
  }
  const auto used = classify_argument(lead.info);
  const auto minimal = minimal_argument_kind(v);
  if (used != minimal) {
    return reject_(make_error_code(errc::non_canonical),
                   "value {} encoded in {}, shortest form is {}",
                   v, to_string(used), to_string(minimal));
  }
  out = v;
  return {};
}

std::error_code Decoder::read_length_(major_type expected, std::int64_t& out) noexcept {
  Lead lead;
  auto ec = expect_major_(expected, lead);
  if (ec) {
    return ec;
  }
  if (classify_argument(lead.info) == argument_kind::indefinite) {
    out = kIndefiniteLength;
    return {};
  }

  std::uint64_t v = 0;
  ec = read_canonical_argument_(lead, v);
  if (ec) {
    return ec;
  }
  if (v > kInt64Max) {
    return reject_(make_error_code(errc::malformed_length),
                   "declared length {} is not representable", v);
  }
  out = static_cast<std::int64_t>(v);
  return {};
}

std::error_code Decoder::read_fixed_width_(argument_kind expected, std::int64_t& out) noexcept {
  Lead lead;
  std::uint64_t transform = 0;
  auto ec = expect_integer_(lead, transform);
  if (ec) {
    return ec;
  }

  const auto kind = classify_argument(lead.info);
  if (kind != expected) {
    return reject_(make_error_code(errc::unexpected_subtype),
                   "unexpected payload/length: expected {}, got {}", to_string(expected), to_string(kind));
  }

  std::uint64_t magnitude = 0;
  ec = read_argument_(lead, magnitude);
  if (ec) {
    return ec;
  }
  if (magnitude > kInt64Max) {
    return reject_(make_error_code(errc::value_out_of_range),
                   "{} magnitude {} exceeds int64", to_string(lead.type), magnitude);
  }
  out = static_cast<std::int64_t>(magnitude ^ transform);
  return {};
}

std::error_code Decoder::check_materializable_(std::int64_t length, std::size_t max_size) noexcept {
  if (length == kIndefiniteLength) {
    return reject_(make_error_code(errc::malformed_length),
                   "indefinite-length string must be read chunk by chunk");
  }
  if (length < 0) {
    return reject_(make_error_code(errc::malformed_length), "negative length {}", length);
  }
  if (static_cast<std::uint64_t>(length) > options_.max_string_length) {
    return reject_(make_error_code(errc::length_overflow),
                   "declared length {} exceeds limit {}", length, options_.max_string_length);
  }
  if (static_cast<std::uint64_t>(length) > max_size) {
    return reject_(make_error_code(errc::length_overflow),
                   "declared length {} exceeds platform maximum {}", length, max_size);
  }
  return {};
}

template <class Container>
std::error_code Decoder::read_payload_(Container& out, std::size_t length) noexcept {
  std::size_t done = 0;
  while (done < length) {
    const auto n = std::min(length - done, kPayloadChunk);
    try {
      out.resize(done + n);
    } catch (const std::bad_alloc&) {
      out.clear();
      return reject_(core::make_error_code(core::errc::out_of_memory),
                     "growing payload to {} of {} bytes", done + n, length);
    } catch (const std::length_error&) {
      out.clear();
      return reject_(make_error_code(errc::length_overflow),
                     "payload of {} bytes", length);
    }

    auto ec = pull_exact_(mutable_bytes_view{reinterpret_cast<byte*>(out.data()) + done, n});
    if (ec) {
      out.clear();
      return ec;
    }
    done += n;
  }
  return {};
}

// ---------------------------------------------------------------------------
// 公共读取接口
// ---------------------------------------------------------------------------

std::error_code Decoder::read_array_length(std::int64_t& out) noexcept {
  op_ = "read_array_length";
  return read_length_(major_type::array, out);
}

std::error_code Decoder::read_map_length(std::int64_t& out) noexcept {
  op_ = "read_map_length";
  return read_length_(major_type::map, out);
}

std::error_code Decoder::read_byte_string_length(std::int64_t& out) noexcept {
  op_ = "read_byte_string_length";
  return read_length_(major_type::byte_string, out);
}

std::error_code Decoder::read_text_string_length(std::int64_t& out) noexcept {
  op_ = "read_text_string_length";
  return read_length_(major_type::text_string, out);
}

std::error_code Decoder::read_byte_string(std::vector<byte>& out) noexcept {
  op_ = "read_byte_string";
  out.clear();

  std::int64_t len = 0;
  auto ec = read_length_(major_type::byte_string, len);
  if (ec) {
    return ec;
  }
  ec = check_materializable_(len, out.max_size());
  if (ec) {
    return ec;
  }
  return read_payload_(out, static_cast<std::size_t>(len));
}

std::error_code Decoder::read_text_string(std::string& out) noexcept {
  op_ = "read_text_string";
  out.clear();

  std::int64_t len = 0;
  auto ec = read_length_(major_type::text_string, len);
  if (ec) {
    return ec;
  }
  ec = check_materializable_(len, out.max_size());
  if (ec) {
    return ec;
  }
  ec = read_payload_(out, static_cast<std::size_t>(len));
  if (ec) {
    return ec;
  }

  const bytes_view buf{reinterpret_cast<const byte*>(out.data()), out.size()};
  std::size_t bad = 0;
  if (!utils::validate_utf8(buf, bad)) {
    ec = make_error_code(errc::invalid_utf8);
    if (core::logger().should_log(spdlog::level::debug)) {
      reject_(ec, "at byte {} of {}: {}", bad, buf.size(), utils::to_hex(buf.subspan(bad), 8));
    }
    out.clear();
    return ec;
  }
  return {};
}

std::error_code Decoder::read_int(std::int64_t& out) noexcept {
  op_ = "read_int";

  Lead lead;
  std::uint64_t transform = 0;
  auto ec = expect_integer_(lead, transform);
  if (ec) {
    return ec;
  }

  std::uint64_t magnitude = 0;
  ec = read_canonical_argument_(lead, magnitude);
  if (ec) {
    return ec;
  }
  if (magnitude > kInt64Max) {
    return reject_(make_error_code(errc::value_out_of_range),
                   "{} magnitude {} exceeds int64", to_string(lead.type), magnitude);
  }
  out = static_cast<std::int64_t>(magnitude ^ transform);
  return {};
}

std::error_code Decoder::read_uint(std::uint64_t& out) noexcept {
  op_ = "read_uint";

  Lead lead;
  auto ec = expect_major_(major_type::unsigned_integer, lead);
  if (ec) {
    return ec;
  }
  return read_canonical_argument_(lead, out);
}

std::error_code Decoder::read_small_int(std::int32_t& out) noexcept {
  op_ = "read_small_int";
  std::int64_t v = 0;
  auto ec = read_fixed_width_(argument_kind::immediate, v);
  if (ec) {
    return ec;
  }
  out = static_cast<std::int32_t>(v);
  return {};
}

std::error_code Decoder::read_int8(std::int32_t& out) noexcept {
  op_ = "read_int8";
  std::int64_t v = 0;
  auto ec = read_fixed_width_(argument_kind::one_byte, v);
  if (ec) {
    return ec;
  }
  out = static_cast<std::int32_t>(v);
  return {};
}

std::error_code Decoder::read_int16(std::int32_t& out) noexcept {
  op_ = "read_int16";
  std::int64_t v = 0;
  auto ec = read_fixed_width_(argument_kind::two_bytes, v);
  if (ec) {
    return ec;
  }
  out = static_cast<std::int32_t>(v);
  return {};
}

std::error_code Decoder::read_int32(std::int64_t& out) noexcept {
  op_ = "read_int32";
  return read_fixed_width_(argument_kind::four_bytes, out);
}

std::error_code Decoder::read_int64(std::int64_t& out) noexcept {
  op_ = "read_int64";
  return read_fixed_width_(argument_kind::eight_bytes, out);
}

std::error_code Decoder::read_tag(std::uint64_t& out) noexcept {
  op_ = "read_tag";

  Lead lead;
  auto ec = expect_major_(major_type::tag, lead);
  if (ec) {
    return ec;
  }
  return read_canonical_argument_(lead, out);
}

std::error_code Decoder::read_boolean(bool& out) noexcept {
  op_ = "read_boolean";

  Lead lead;
  auto ec = expect_major_(major_type::float_simple, lead);
  if (ec) {
    return ec;
  }
  if (lead.info != kFalse && lead.info != kTrue) {
    return reject_(make_error_code(errc::unexpected_subtype),
                   "unexpected boolean value {}", lead.info);
  }
  out = lead.info == kTrue;
  return {};
}

std::error_code Decoder::read_null() noexcept {
  op_ = "read_null";
  return expect_exact_(major_type::float_simple, kNull);
}

std::error_code Decoder::read_undefined() noexcept {
  op_ = "read_undefined";
  return expect_exact_(major_type::float_simple, kUndefined);
}

std::error_code Decoder::read_break() noexcept {
  op_ = "read_break";
  return expect_exact_(major_type::float_simple, kBreak);
}

std::error_code Decoder::read_simple_value(std::uint8_t& out) noexcept {
  op_ = "read_simple_value";
  auto ec = expect_exact_(major_type::float_simple, kSimpleValue);
  if (ec) {
    return ec;
  }
  return pull_byte_(out);
}

std::error_code Decoder::read_half_float(double& out) noexcept {
  op_ = "read_half_float";
  auto ec = expect_exact_(major_type::float_simple, kHalfPrecisionFloat);
  if (ec) {
    return ec;
  }
  std::uint64_t bits = 0;
  ec = read_be_(2, bits);
  if (ec) {
    return ec;
  }
  out = half_to_double(static_cast<std::uint16_t>(bits));
  return {};
}

std::error_code Decoder::read_float(float& out) noexcept {
  op_ = "read_float";
  auto ec = expect_exact_(major_type::float_simple, kSinglePrecisionFloat);
  if (ec) {
    return ec;
  }
  std::uint64_t bits = 0;
  ec = read_be_(4, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<float>(static_cast<std::uint32_t>(bits));
  return {};
}

std::error_code Decoder::read_double(double& out) noexcept {
  op_ = "read_double";
  auto ec = expect_exact_(major_type::float_simple, kDoublePrecisionFloat);
  if (ec) {
    return ec;
  }
  std::uint64_t bits = 0;
  ec = read_be_(8, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<double>(bits);
  return {};
}

}  // namespace cbor::decode
