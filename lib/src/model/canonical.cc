//
// Canonical Literal Text Implementation
//

#include <snapfix/canonical.hh>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <set>

namespace snapfix {

namespace {

    constexpr char kBase64Alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    int base64_index(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

    int hex_digit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool is_ascii_digit(char c) {
        return c >= '0' && c <= '9';
    }

    bool is_ascii_letter(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    /// Scalars that attach to the preceding one instead of starting a character
    bool is_extending_scalar(char32_t c) {
        return (c >= 0x0300 && c <= 0x036F)      // combining diacritical marks
            || (c >= 0x0483 && c <= 0x0489)
            || (c >= 0x0591 && c <= 0x05C7)
            || (c >= 0x0610 && c <= 0x061A)
            || (c >= 0x064B && c <= 0x065F)
            || (c >= 0x0900 && c <= 0x0903)
            || (c >= 0x093A && c <= 0x094F)      // Devanagari vowel signs
            || (c >= 0x1160 && c <= 0x11FF)      // Hangul medial vowels and finals
            || (c >= 0x1AB0 && c <= 0x1AFF)
            || (c >= 0x1DC0 && c <= 0x1DFF)
            || (c >= 0x20D0 && c <= 0x20FF)
            || (c >= 0xFE00 && c <= 0xFE0F)      // variation selectors
            || (c >= 0xFE20 && c <= 0xFE2F)
            || (c >= 0x1F3FB && c <= 0x1F3FF)    // emoji skin tones
            || (c >= 0xE0020 && c <= 0xE007F)    // tags
            || (c >= 0xE0100 && c <= 0xE01EF);
    }

    bool is_regional_indicator(char32_t c) {
        return c >= 0x1F1E6 && c <= 0x1F1FF;
    }

    constexpr char32_t kZeroWidthJoiner = 0x200D;

    // Shared by format_double and format_float
    template <typename T>
    std::string format_floating(T value, T fixed_low, T fixed_high) {
        std::array<char, 64> buffer{};
        const T magnitude = std::fabs(value);
        const bool fixed = magnitude == T(0) || (magnitude >= fixed_low && magnitude < fixed_high);

        auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                    fixed ? std::chars_format::fixed
                                          : std::chars_format::scientific);
        std::string text(buffer.data(), result.ptr);

        if (fixed && text.find('.') == std::string::npos) {
            text += ".0";
        }
        return text;
    }

} // anonymous namespace

// ============================================================================
// String literals
// ============================================================================

std::optional<char32_t> decode_utf8_scalar(std::string_view text, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);

    std::size_t length = 0;
    char32_t scalar = 0;
    if (lead < 0x80) {
        ++pos;
        return static_cast<char32_t>(lead);
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        scalar = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        scalar = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        scalar = lead & 0x07;
    } else {
        return std::nullopt;
    }

    if (pos + length > text.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return std::nullopt;
        }
        scalar = (scalar << 6) | (next & 0x3F);
    }

    // Overlong encodings, surrogates and values beyond U+10FFFF
    static constexpr char32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (scalar < kMinimum[length] || scalar > 0x10FFFF ||
        (scalar >= 0xD800 && scalar <= 0xDFFF)) {
        return std::nullopt;
    }

    pos += length;
    return scalar;
}

std::optional<std::string> quote_string_literal(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2 + text.size() / 4);
    result += '"';

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto scalar = decode_utf8_scalar(text, pos);
        if (!scalar) {
            return std::nullopt;
        }

        switch (*scalar) {
            case U'\\': result += "\\\\"; break;
            case U'"':  result += "\\\""; break;
            case U'\n': result += "\\n"; break;
            case U'\r': result += "\\r"; break;
            case U'\t': result += "\\t"; break;
            default:
                if (*scalar < 0x20 || *scalar > 0x7E) {
                    char escape[16];
                    std::snprintf(escape, sizeof(escape), "\\u{%X}",
                                  static_cast<unsigned>(*scalar));
                    result += escape;
                } else {
                    result += static_cast<char>(*scalar);
                }
                break;
        }
    }

    result += '"';
    return result;
}

// ============================================================================
// Numbers
// ============================================================================

std::string format_double(double value) {
    return format_floating<double>(value, 1e-5, 1e16);
}

std::string format_float(float value) {
    return format_floating<float>(value, 1e-5f, 1e16f);
}

std::string format_hex_byte(std::uint8_t byte) {
    char text[8];
    std::snprintf(text, sizeof(text), "0x%02X", static_cast<unsigned>(byte));
    return text;
}

bool is_decimal_numeral(std::string_view text) {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }

    std::size_t digits = 0;
    while (i < text.size() && is_ascii_digit(text[i])) {
        ++i;
        ++digits;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && is_ascii_digit(text[i])) {
            ++i;
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
            ++i;
        }
        std::size_t exponent_digits = 0;
        while (i < text.size() && is_ascii_digit(text[i])) {
            ++i;
            ++exponent_digits;
        }
        if (exponent_digits == 0) {
            return false;
        }
    }
    return i == text.size();
}

bool is_plain_identifier(std::string_view text) {
    if (text.empty() || !(is_ascii_letter(text[0]) || text[0] == '_')) {
        return false;
    }
    for (char c : text) {
        if (!(is_ascii_letter(c) || is_ascii_digit(c) || c == '_')) {
            return false;
        }
    }
    return true;
}

bool is_swift_keyword(std::string_view text) {
    static const std::set<std::string_view> keywords = {
        "associatedtype", "class", "deinit", "enum", "extension", "fileprivate", "func",
        "import", "init", "inout", "internal", "let", "open", "operator", "private",
        "precedencegroup", "protocol", "public", "rethrows", "static", "struct",
        "subscript", "typealias", "var", "break", "case", "catch", "continue", "default",
        "defer", "do", "else", "fallthrough", "for", "guard", "if", "in", "repeat",
        "return", "throw", "switch", "where", "while", "as", "false", "is", "nil",
        "self", "Self", "super", "throws", "true", "try", "await", "async"
    };
    return keywords.count(text) > 0;
}

std::optional<std::string> swift_name(std::string_view text) {
    if (text == "_" || !is_plain_identifier(text)) {
        return std::nullopt;
    }
    if (is_swift_keyword(text)) {
        return "`" + std::string(text) + "`";
    }
    return std::string(text);
}

bool is_single_grapheme(std::string_view text) {
    if (text == "\r\n") {
        return true;
    }

    std::size_t pos = 0;
    auto first = decode_utf8_scalar(text, pos);
    if (!first) {
        return false;
    }

    bool joined = false;
    bool flag_open = is_regional_indicator(*first);
    while (pos < text.size()) {
        auto scalar = decode_utf8_scalar(text, pos);
        if (!scalar) {
            return false;
        }
        if (joined) {
            joined = false;
        } else if (*scalar == kZeroWidthJoiner) {
            joined = true;
        } else if (flag_open && is_regional_indicator(*scalar)) {
            flag_open = false;
        } else if (!is_extending_scalar(*scalar)) {
            return false;
        } else {
            flag_open = false;
        }
    }
    return true;
}

// ============================================================================
// UUID
// ============================================================================

std::string format_uuid(const Uuid& uuid) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += kHex[uuid[i] >> 4];
        text += kHex[uuid[i] & 0x0F];
    }
    return text;
}

std::optional<Uuid> parse_uuid(std::string_view text) {
    if (text.size() != 36) {
        return std::nullopt;
    }

    Uuid uuid{};
    std::size_t byte = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        const int high = hex_digit(text[i]);
        const int low = hex_digit(text[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        uuid[byte++] = static_cast<std::uint8_t>((high << 4) | low);
        i += 2;
    }
    return uuid;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const Bytes& bytes) {
    std::string text;
    text.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const std::uint32_t chunk = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        text += kBase64Alphabet[(chunk >> 18) & 0x3F];
        text += kBase64Alphabet[(chunk >> 12) & 0x3F];
        text += kBase64Alphabet[(chunk >> 6) & 0x3F];
        text += kBase64Alphabet[chunk & 0x3F];
    }

    const std::size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        const std::uint32_t chunk = bytes[i] << 16;
        text += kBase64Alphabet[(chunk >> 18) & 0x3F];
        text += kBase64Alphabet[(chunk >> 12) & 0x3F];
        text += "==";
    } else if (remaining == 2) {
        const std::uint32_t chunk = (bytes[i] << 16) | (bytes[i + 1] << 8);
        text += kBase64Alphabet[(chunk >> 18) & 0x3F];
        text += kBase64Alphabet[(chunk >> 12) & 0x3F];
        text += kBase64Alphabet[(chunk >> 6) & 0x3F];
        text += '=';
    }
    return text;
}

std::optional<Bytes> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    Bytes bytes;
    bytes.reserve(text.size() / 4 * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        int values[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=' && last && j >= 2) {
                values[j] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            values[j] = base64_index(c);
            if (values[j] < 0) {
                return std::nullopt;
            }
        }

        const std::uint32_t chunk = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        bytes.push_back(static_cast<std::uint8_t>((chunk >> 16) & 0xFF));
        if (padding < 2) {
            bytes.push_back(static_cast<std::uint8_t>((chunk >> 8) & 0xFF));
        }
        if (padding < 1) {
            bytes.push_back(static_cast<std::uint8_t>(chunk & 0xFF));
        }
    }
    return bytes;
}

} // namespace snapfix
