//
// Canonical Literal Text
//
// Deterministic text for the leaves of a rendered expression:
// - String literal escaping (UTF-8 aware)
// - Shortest round-trip floating point text
// - UUID, hex byte and base64 forms
// - Identifier and decimal numeral checks
//

#pragma once

#include <snapfix/value.hh>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace snapfix {

/**
 * Quote and escape text as a Swift string literal.
 *
 * Escapes `\\`, `\"`, `\n`, `\r`, `\t`; every other Unicode scalar below
 * U+0020 or above U+007E becomes `\u{HEX}`.
 *
 * @return the quoted literal, or std::nullopt if text is not valid UTF-8
 */
std::optional<std::string> quote_string_literal(std::string_view text);

/// Decode one UTF-8 scalar at text[pos]; advances pos. std::nullopt on malformed input.
std::optional<char32_t> decode_utf8_scalar(std::string_view text, std::size_t& pos);

/**
 * Shortest text that reads back as the same double.
 *
 * Fixed notation (with a trailing ".0" when integral) for zero and magnitudes
 * in [1e-5, 1e16), scientific notation otherwise. Not defined for NaN/infinity.
 */
std::string format_double(double value);

/// Same rules as format_double, with float precision
std::string format_float(float value);

/// "0x0A"
std::string format_hex_byte(std::uint8_t byte);

/// Canonical uppercase 8-4-4-4-12 form
std::string format_uuid(const Uuid& uuid);

/// Parse 8-4-4-4-12 hex form (either case)
std::optional<Uuid> parse_uuid(std::string_view text);

/// RFC 4648 base64 with padding
std::string base64_encode(const Bytes& bytes);
std::optional<Bytes> base64_decode(std::string_view text);

/// Optional sign, digits, optional fraction, optional exponent ("12.50", "-3", "1e-7")
bool is_decimal_numeral(std::string_view text);

/// ASCII letter or underscore, followed by letters, digits or underscores
bool is_plain_identifier(std::string_view text);

/// Reserved word that must be backticked to be used as a name
bool is_swift_keyword(std::string_view text);

/**
 * Text usable as a Swift argument label or enum case name.
 *
 * Plain identifiers are returned as is and keywords are backticked.
 *
 * @return std::nullopt for anything else, including a lone "_"
 */
std::optional<std::string> swift_name(std::string_view text);

/**
 * True if text is valid UTF-8 holding exactly one user-perceived character.
 *
 * A base scalar may be followed by combining marks, variation selectors,
 * emoji modifiers and tag characters; ZWJ joins the next scalar, and two
 * regional indicators form one flag. "\r\n" counts as one character.
 */
bool is_single_grapheme(std::string_view text);

} // namespace snapfix
