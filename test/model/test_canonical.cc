//
// Tests for canonical literal text
//

#include <doctest/doctest.h>
#include <snapfix/canonical.hh>

#include <string>

using namespace snapfix;

TEST_SUITE("Model - Canonical text") {

    TEST_CASE("String literal escaping") {
        CHECK(*quote_string_literal("hello") == "\"hello\"");
        CHECK(*quote_string_literal("a\"b") == "\"a\\\"b\"");
        CHECK(*quote_string_literal("back\\slash") == "\"back\\\\slash\"");
        CHECK(*quote_string_literal("line\nbreak\ttab\r") == "\"line\\nbreak\\ttab\\r\"");
        CHECK(*quote_string_literal(std::string("\x01", 1)) == "\"\\u{1}\"");
    }

    TEST_CASE("Non-ASCII scalars become unicode escapes") {
        CHECK(*quote_string_literal("caf\xC3\xA9") == "\"caf\\u{E9}\"");
        CHECK(*quote_string_literal("\xF0\x9F\x98\x80") == "\"\\u{1F600}\"");
    }

    TEST_CASE("Malformed UTF-8 is rejected") {
        CHECK_FALSE(quote_string_literal("\xC3").has_value());
        CHECK_FALSE(quote_string_literal("\xFF\xFE").has_value());
    }

    TEST_CASE("Double text") {
        CHECK(format_double(0.0) == "0.0");
        CHECK(format_double(1.0) == "1.0");
        CHECK(format_double(-2.5) == "-2.5");
        CHECK(format_double(0.1) == "0.1");
        CHECK(format_double(1e20) == "1e+20");
        CHECK(format_float(0.1f) == "0.1");
    }

    TEST_CASE("Hex bytes and UUIDs") {
        CHECK(format_hex_byte(0x0A) == "0x0A");
        CHECK(format_hex_byte(0xFF) == "0xFF");

        auto uuid = parse_uuid("e621e1f8-c36c-495a-93fc-0c247a3e6e5f");
        REQUIRE(uuid.has_value());
        CHECK(format_uuid(*uuid) == "E621E1F8-C36C-495A-93FC-0C247A3E6E5F");

        CHECK_FALSE(parse_uuid("not-a-uuid").has_value());
        CHECK_FALSE(parse_uuid("E621E1F8C36C495A93FC0C247A3E6E5F").has_value());
    }

    TEST_CASE("Base64") {
        CHECK(base64_encode({}) == "");
        CHECK(base64_encode({'M'}) == "TQ==");
        CHECK(base64_encode({'M', 'a'}) == "TWE=");
        CHECK(base64_encode({'M', 'a', 'n'}) == "TWFu");

        auto decoded = base64_decode("SGVsbG8=");
        REQUIRE(decoded.has_value());
        CHECK(std::string(decoded->begin(), decoded->end()) == "Hello");
        CHECK_FALSE(base64_decode("SGV$bG8=").has_value());
    }

    TEST_CASE("Decimal numerals") {
        CHECK(is_decimal_numeral("12.50"));
        CHECK(is_decimal_numeral("-3"));
        CHECK(is_decimal_numeral("1e-7"));
        CHECK_FALSE(is_decimal_numeral(""));
        CHECK_FALSE(is_decimal_numeral("12.5.1"));
        CHECK_FALSE(is_decimal_numeral("abc"));
    }

    TEST_CASE("Swift names") {
        CHECK(swift_name("firstName") == "firstName");
        CHECK(swift_name("default") == "`default`");
        CHECK(swift_name("Self") == "`Self`");
        CHECK_FALSE(swift_name("first name").has_value());
        CHECK_FALSE(swift_name("2fa").has_value());
        CHECK_FALSE(swift_name("_").has_value());
        CHECK_FALSE(swift_name("").has_value());
    }

    TEST_CASE("Single characters") {
        CHECK(is_single_grapheme("a"));
        CHECK(is_single_grapheme("\xC3\xA9"));                          // precomposed e acute
        CHECK(is_single_grapheme("e\xCC\x81"));                         // e + combining acute
        CHECK(is_single_grapheme("\r\n"));
        CHECK(is_single_grapheme("\xE2\x9D\xA4\xEF\xB8\x8F"));          // heart + VS16
        CHECK(is_single_grapheme("\xF0\x9F\x91\x8D\xF0\x9F\x8F\xBD"));  // thumbs up + skin tone
        CHECK(is_single_grapheme("\xF0\x9F\x87\xA9\xF0\x9F\x87\xAA"));  // flag DE
        CHECK(is_single_grapheme("\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x92\xBB"));  // woman ZWJ laptop

        CHECK_FALSE(is_single_grapheme(""));
        CHECK_FALSE(is_single_grapheme("ab"));
        CHECK_FALSE(is_single_grapheme("a "));
        CHECK_FALSE(is_single_grapheme("\xF0\x9F\x87\xA9\xF0\x9F\x87\xAA\xF0\x9F\x87\xAB"));
        CHECK_FALSE(is_single_grapheme("\xC3"));
    }

    TEST_CASE("Plain identifiers") {
        CHECK(is_plain_identifier("active"));
        CHECK(is_plain_identifier("_private2"));
        CHECK_FALSE(is_plain_identifier("2fast"));
        CHECK_FALSE(is_plain_identifier("in-progress"));
        CHECK_FALSE(is_plain_identifier(""));
    }
}
