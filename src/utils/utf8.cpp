#include "cbor/utils/utf8.hpp"

#include <cstdint>

namespace cbor::utils {
namespace {

[[nodiscard]] constexpr bool is_continuation(std::uint8_t b) noexcept {
    return (b & 0xC0u) == 0x80u;
}

// 引导字节 -> 序列长度；0 表示不可能出现在序列开头。
[[nodiscard]] constexpr std::size_t sequence_length(std::uint8_t lead) noexcept {
    if (lead < 0x80u) {
        return 1;
    }
    if ((lead & 0xE0u) == 0xC0u) {
        return 2;
    }
    if ((lead & 0xF0u) == 0xE0u) {
        return 3;
    }
    if ((lead & 0xF8u) == 0xF0u) {
        return 4;
    }
    return 0;
}

} // namespace

bool validate_utf8(cbor::core::bytes_view bytes, std::size_t &error_offset) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = bytes[i];
        const auto len = sequence_length(lead);
        if (len == 0 || bytes.size() - i < len) {
            error_offset = i;
            return false;
        }
        if (len == 1) {
            ++i;
            continue;
        }

        std::uint32_t cp = lead & (0x7Fu >> len);
        for (std::size_t k = 1; k < len; ++k) {
            const auto next = bytes[i + k];
            if (!is_continuation(next)) {
                error_offset = i;
                return false;
            }
            cp = (cp << 6) | (next & 0x3Fu);
        }

        // 每种长度可表示的最小码点：低于该值即为过长编码。
        constexpr std::uint32_t kMinForLength[] = {0, 0, 0x80u, 0x800u, 0x10000u};
        if (cp < kMinForLength[len] || (cp >= 0xD800u && cp <= 0xDFFFu) || cp > 0x10FFFFu) {
            error_offset = i;
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace cbor::utils
