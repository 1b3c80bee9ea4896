#include "cbor/decode/types.hpp"

namespace cbor::decode {

const char* to_string(major_type type) noexcept {
  switch (type) {
    case major_type::unsigned_integer:
      return "unsigned integer";
    case major_type::negative_integer:
      return "negative integer";
    case major_type::byte_string:
      return "byte string";
    case major_type::text_string:
      return "text string";
    case major_type::array:
      return "array";
    case major_type::map:
      return "map";
    case major_type::tag:
      return "tag";
    case major_type::float_simple:
      return "float/simple value";
  }
  return "unknown";
}

const char* to_string(argument_kind kind) noexcept {
  switch (kind) {
    case argument_kind::immediate:
      return "no payload";
    case argument_kind::one_byte:
      return "one byte";
    case argument_kind::two_bytes:
      return "two bytes";
    case argument_kind::four_bytes:
      return "four bytes";
    case argument_kind::eight_bytes:
      return "eight bytes";
    case argument_kind::indefinite:
      return "indefinite";
    case argument_kind::reserved:
      return "reserved";
  }
  return "unknown";
}

}  // namespace cbor::decode
