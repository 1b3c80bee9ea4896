#include "cbor/utils/hex.hpp"

#include <cctype>

namespace cbor::utils {
namespace {

constexpr char kDigits[] = "0123456789abcdef";

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '{':
    case '}':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string to_hex(cbor::core::bytes_view bytes, std::size_t max_bytes) {
    const bool truncated = max_bytes != 0 && bytes.size() > max_bytes;
    const auto n = truncated ? max_bytes : bytes.size();

    std::string out;
    out.reserve(n * 3 + 4);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        out.push_back(kDigits[(bytes[i] >> 4) & 0x0F]);
        out.push_back(kDigits[bytes[i] & 0x0F]);
    }
    if (truncated) {
        out += " ...";
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<cbor::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 0x/0X 前缀只允许出现在字节边界上，避免把 "a0x" 之类的输入误吞。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size()) {
            const auto n = static_cast<unsigned char>(text[i + 1]);
            if (n == 'x' || n == 'X') {
                ++i;
                continue;
            }
        }

        const int v = hex_value_(c);
        if (v < 0) {
            return cbor::core::make_error_code(cbor::core::errc::invalid_argument);
        }

        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<cbor::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    if (hi_nibble >= 0) {
        return cbor::core::make_error_code(cbor::core::errc::invalid_argument);
    }

    return {};
}

} // namespace cbor::utils
