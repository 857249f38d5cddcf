//
// Tests for built-in literal renderers
//

#include <doctest/doctest.h>
#include <snapfix/environment.hh>
#include <snapfix/errors.hh>
#include <snapfix/value_renderer.hh>

#include <cmath>
#include <limits>
#include <string>

using namespace snapfix;

namespace {

    std::string render(const Value& value, RenderOptions options = {}) {
        Environment env;
        return render_value(value, env.make_context(options));
    }

    Bytes sequential_bytes(std::size_t count) {
        Bytes bytes;
        for (std::size_t i = 0; i < count; ++i) {
            bytes.push_back(static_cast<std::uint8_t>(i));
        }
        return bytes;
    }

} // anonymous namespace

TEST_SUITE("Render - Builtins") {

    TEST_CASE("Nil and booleans") {
        CHECK(render(Value::nil()) == "nil");
        CHECK(render(Value::boolean(true)) == "true");
        CHECK(render(Value::boolean(false)) == "false");
    }

    TEST_CASE("Integers carry their width") {
        CHECK(render(Value::integer(42)) == "42");
        CHECK(render(Value::integer(-7)) == "-7");
        CHECK(render(Value::integer(5, IntegerWidth::Int8)) == "Int8(5)");
        CHECK(render(Value::integer(-5, IntegerWidth::Int32)) == "Int32(-5)");
        CHECK(render(Value::unsigned_integer(7, IntegerWidth::UInt64)) == "UInt64(7)");
        CHECK(render(Value::unsigned_integer(255, IntegerWidth::UInt8)) == "UInt8(255)");
    }

    TEST_CASE("Floating point") {
        CHECK(render(Value::floating(3.0)) == "3.0");
        CHECK(render(Value::floating(0.1)) == "0.1");
        CHECK(render(Value::floating(0.5, FloatWidth::Float)) == "0.5");
        CHECK(render(Value::floating(std::numeric_limits<double>::infinity())) == "Double.infinity");
        CHECK(render(Value::floating(-std::numeric_limits<double>::infinity())) == "-Double.infinity");
        CHECK(render(Value::floating(std::nan(""), FloatWidth::Float)) == "Float.nan");
    }

    TEST_CASE("Strings and characters") {
        CHECK(render(Value::string("Alice")) == "\"Alice\"");
        CHECK(render(Value::string("say \"hi\"\n")) == "\"say \\\"hi\\\"\\n\"");
        CHECK(render(Value::character("x")) == "Character(\"x\")");
    }

    TEST_CASE("Invalid UTF-8 reports the breadcrumb") {
        auto record = Value::record("User", {Member("name", Value::string("\xC3"))});
        try {
            (void)render(record);
            FAIL("expected reflection_error");
        } catch (const reflection_error& e) {
            CHECK(format_path(e.path()) == "name");
        }
    }

    TEST_CASE("Foundation types") {
        CHECK(render(Value::date(0)) == "Date(timeIntervalSince1970: 0.0)");
        CHECK(render(Value::date(1700000000.5)) == "Date(timeIntervalSince1970: 1700000000.5)");

        Uuid uuid{};
        uuid[15] = 0xAB;
        CHECK(render(Value::uuid(uuid)) == "UUID(uuidString: \"00000000-0000-0000-0000-0000000000AB\")!");

        CHECK(render(Value::url("https://example.com/a?b=1")) == "URL(string: \"https://example.com/a?b=1\")!");
        CHECK(render(Value::decimal("12.50")) == "Decimal(string: \"12.50\")!");
    }

    TEST_CASE("Invalid decimal description") {
        CHECK_THROWS_AS(render(Value::decimal("twelve")), reflection_error);
    }

    TEST_CASE("Binary data switches to base64 above the threshold") {
        CHECK(render(Value::data({})) == "Data([])");
        CHECK(render(Value::data({0x0A, 0xFF})) == "Data([0x0A, 0xFF])");

        const std::string sixteen = render(Value::data(sequential_bytes(16)));
        CHECK(sixteen.rfind("Data([0x00, 0x01,", 0) == 0);
        CHECK(sixteen.find("0x0F])") != std::string::npos);

        const std::string seventeen = render(Value::data(sequential_bytes(17)));
        CHECK(seventeen == "Data(base64Encoded: \"AAECAwQFBgcICQoLDA0ODxA=\")!");
    }

    TEST_CASE("Threshold is configurable") {
        RenderOptions options;
        options.inline_binary_threshold = 1;
        CHECK(render(Value::data({0x01}), options) == "Data([0x01])");
        CHECK(render(Value::data({'M', 'a'}), options) == "Data(base64Encoded: \"TWE=\")!");
    }
}
