//
// Tests for the value model, breadcrumb paths and native reflection
//

#include <doctest/doctest.h>
#include <snapfix/path.hh>
#include <snapfix/reflect.hh>
#include <snapfix/value.hh>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace snapfix;

namespace {

    struct Address {
        std::string city;
        std::string zip_code;
    };

    enum class Role { Admin, Guest };

    struct Account {
        std::int64_t id;
        std::string name;
        std::optional<std::string> nickname;
        std::vector<std::uint8_t> flags;
        Address address;
        Role role;
    };

} // anonymous namespace

template <>
struct snapfix::Reflection<Address> {
    static constexpr const char* type_name = "Address";
    static constexpr auto members = std::make_tuple(
        snapfix::field("city", &Address::city),
        snapfix::field("zipCode", &Address::zip_code));
};

template <>
struct snapfix::Reflection<Role> {
    static constexpr const char* type_name = "Role";
    static std::string case_name(Role role) {
        return role == Role::Admin ? "admin" : "guest";
    }
};

template <>
struct snapfix::Reflection<Account> {
    static constexpr const char* type_name = "Account";
    static constexpr auto members = std::make_tuple(
        snapfix::field("id", &Account::id),
        snapfix::field("name", &Account::name),
        snapfix::field("nickname", &Account::nickname),
        snapfix::field("flags", &Account::flags),
        snapfix::field("address", &Account::address),
        snapfix::field("role", &Account::role));
};

TEST_SUITE("Model - Value") {

    TEST_CASE("Default value is nil") {
        Value v;
        CHECK(v.is_nil());
        CHECK(v.kind() == Value::Kind::Nil);
        CHECK(v.type_key() == "Optional");
    }

    TEST_CASE("Type keys of builtin kinds") {
        CHECK(Value::boolean(true).type_key() == "Bool");
        CHECK(Value::integer(1).type_key() == "Int");
        CHECK(Value::integer(1, IntegerWidth::Int8).type_key() == "Int8");
        CHECK(Value::unsigned_integer(1, IntegerWidth::UInt64).type_key() == "UInt64");
        CHECK(Value::floating(1.5).type_key() == "Double");
        CHECK(Value::floating(1.5, FloatWidth::Float).type_key() == "Float");
        CHECK(Value::string("x").type_key() == "String");
        CHECK(Value::character("x").type_key() == "Character");
        CHECK(Value::date(0).type_key() == "Date");
        CHECK(Value::uuid(Uuid{}).type_key() == "UUID");
        CHECK(Value::url("https://example.com").type_key() == "URL");
        CHECK(Value::decimal("1.5").type_key() == "Decimal");
        CHECK(Value::data({1, 2}).type_key() == "Data");
        CHECK(Value::sequence({}).type_key() == "Array");
        CHECK(Value::map({}).type_key() == "Dictionary");
        CHECK(Value::set({}).type_key() == "Set");
    }

    TEST_CASE("Named kinds report their declared type") {
        CHECK(Value::collection("IdentifiedArray<Int, User>", {}).type_key() == "IdentifiedArray<Int, User>");
        CHECK(Value::record("User", {}).type_key() == "User");
        CHECK(Value::enumeration("Role", "admin").type_key() == "Role");
        CHECK(Value::object(std::make_shared<Object>("Node")).type_key() == "Node");
        CHECK(Value::opaque("Money", 42L).type_key() == "Money");
    }

    TEST_CASE("Integer range checks") {
        CHECK_NOTHROW(Value::integer(127, IntegerWidth::Int8));
        CHECK_THROWS_AS(Value::integer(128, IntegerWidth::Int8), std::invalid_argument);
        CHECK_THROWS_AS(Value::integer(-1, IntegerWidth::UInt), std::invalid_argument);
        CHECK_THROWS_AS(Value::unsigned_integer(256, IntegerWidth::UInt8), std::invalid_argument);
        CHECK_THROWS_AS(Value::unsigned_integer(UINT64_MAX, IntegerWidth::Int64), std::invalid_argument);

        auto v = Value::unsigned_integer(UINT64_MAX, IntegerWidth::UInt64);
        CHECK(v.as_integer().to_string() == "18446744073709551615");
        CHECK_FALSE(v.as_integer().is_signed());
    }

    TEST_CASE("Invalid factories") {
        CHECK_THROWS_AS(Value::character(""), std::invalid_argument);
        CHECK_THROWS_AS(Value::character("ab"), std::invalid_argument);
        CHECK_THROWS_AS(Value::character("\xFF"), std::invalid_argument);
        CHECK_THROWS_AS(Value::object(nullptr), std::invalid_argument);
    }

    TEST_CASE("Accessor on wrong kind throws logic_error") {
        auto v = Value::string("text");
        CHECK(v.as_text() == "text");
        CHECK_THROWS_AS(v.as_bool(), std::logic_error);
        CHECK_THROWS_AS(v.elements(), std::logic_error);
        CHECK_THROWS_AS(Value::integer(1).type_name(), std::logic_error);
    }

    TEST_CASE("Opaque payload access") {
        auto v = Value::opaque("Money", 1250L);
        REQUIRE(v.opaque_as<long>() != nullptr);
        CHECK(*v.opaque_as<long>() == 1250L);
        CHECK(v.opaque_as<int>() == nullptr);
    }

    TEST_CASE("Objects can be mutated after wrapping") {
        auto node = std::make_shared<Object>("Node");
        auto value = Value::object(node);
        node->add_member("next", value);

        REQUIRE(value.members().size() == 1);
        CHECK(value.members()[0].value.as_object() == node);

        node->clear();
        CHECK(value.members().empty());
    }
}

TEST_SUITE("Model - Path") {

    TEST_CASE("Segment text") {
        CHECK(PathSegment::field("address").to_string() == "address");
        CHECK(PathSegment::index(3).to_string() == "[3]");
        CHECK(PathSegment::key("\"id\"").to_string() == "[\"id\"]");
        CHECK(PathSegment::index(3).name().empty());
        CHECK(PathSegment::index(3).position() == 3);
    }

    TEST_CASE("Path joins with arrows") {
        Path path{PathSegment::field("users"), PathSegment::index(0), PathSegment::field("zipCode")};
        CHECK(format_path(path) == "users → [0] → zipCode");
        CHECK(format_path({}).empty());
    }

    TEST_CASE("Segments compare by kind and content") {
        CHECK(PathSegment::field("a") == PathSegment::field("a"));
        CHECK_FALSE(PathSegment::field("a") == PathSegment::key("a"));
        CHECK_FALSE(PathSegment::index(1) == PathSegment::index(2));
    }
}

TEST_SUITE("Model - Native reflection") {

    TEST_CASE("Integer widths follow the native type") {
        CHECK(make_value(std::int8_t{1}).type_key() == "Int8");
        CHECK(make_value(std::int16_t{1}).type_key() == "Int16");
        CHECK(make_value(std::int32_t{1}).type_key() == "Int");
        CHECK(make_value(std::int64_t{1}).type_key() == "Int");
        CHECK(make_value(std::uint8_t{1}).type_key() == "UInt8");
        CHECK(make_value(std::uint16_t{1}).type_key() == "UInt16");
        CHECK(make_value(std::uint32_t{1}).type_key() == "UInt32");
        CHECK(make_value(std::uint64_t{1}).type_key() == "UInt");
    }

    TEST_CASE("Scalar conversions") {
        CHECK(make_value(true).as_bool());
        CHECK(make_value('x').kind() == Value::Kind::Character);
        CHECK(make_value(1.5f).type_key() == "Float");
        CHECK(make_value(1.5).type_key() == "Double");
        CHECK(make_value(std::string("hi")).as_text() == "hi");
        CHECK(make_value("hi").as_text() == "hi");

        auto epoch = std::chrono::system_clock::time_point{} + std::chrono::seconds(90);
        CHECK(make_value(epoch).as_date() == doctest::Approx(90.0));
    }

    TEST_CASE("Containers") {
        CHECK(make_value(std::optional<int>{}).is_nil());
        CHECK(make_value(std::vector<int>{1, 2, 3}).elements().size() == 3);
        CHECK(make_value(std::set<int>{1, 2}).kind() == Value::Kind::Set);

        auto map = make_value(std::map<std::string, int>{{"a", 1}, {"b", 2}});
        REQUIRE(map.kind() == Value::Kind::Map);
        CHECK(map.entries().size() == 2);
    }

    TEST_CASE("Reflected records and enums") {
        Account account{7, "Alice", std::nullopt, {1}, {"Berlin", "10115"}, Role::Admin};
        auto v = make_value(account);

        REQUIRE(v.kind() == Value::Kind::Record);
        CHECK(v.type_name() == "Account");
        REQUIRE(v.members().size() == 6);
        CHECK(*v.members()[0].label == "id");
        CHECK(v.members()[2].value.is_nil());
        CHECK(v.members()[3].value.elements()[0].type_key() == "UInt8");
        CHECK(v.members()[4].value.type_name() == "Address");

        const auto& role = v.members()[5].value;
        REQUIRE(role.kind() == Value::Kind::Enum);
        CHECK(role.as_enum().case_name == "admin");
    }
}
