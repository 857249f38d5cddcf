//
// Native Type Reflection
//
// Ahead-of-time member descriptions for C++ types, and conversion of native
// values into Value trees.
//
// Usage:
//   struct User { int id; std::string name; };
//
//   template <>
//   struct snapfix::Reflection<User> {
//       static constexpr const char* type_name = "User";
//       static constexpr auto members = std::make_tuple(
//           snapfix::field("id", &User::id),
//           snapfix::field("name", &User::name));
//   };
//
//   Value v = snapfix::make_value(User{42, "Alice"});
//
// Enumerations specialize Reflection with type_name and a
// `static std::string case_name(E)` function instead of members.
//

#pragma once

#include <snapfix/value.hh>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace snapfix {

/// Per-type reflection trait; specialize for each reflected type
template <typename T>
struct Reflection;

/// Labelled member pointer
template <typename Owner, typename M>
struct FieldRef {
    const char* label;
    M Owner::* pointer;
};

template <typename Owner, typename M>
constexpr FieldRef<Owner, M> field(const char* label, M Owner::* pointer) {
    return FieldRef<Owner, M>{label, pointer};
}

template <typename T>
concept Reflected = requires {
    { Reflection<T>::type_name } -> std::convertible_to<const char*>;
};

template <typename T>
concept ReflectedRecord = Reflected<T> && requires { Reflection<T>::members; };

template <typename T>
concept ReflectedEnum = Reflected<T> && std::is_enum_v<T> &&
    requires(T v) { { Reflection<T>::case_name(v) } -> std::convertible_to<std::string>; };

template <typename T>
Value make_value(const T& value);

namespace detail {

    template <typename>
    inline constexpr bool unsupported_native_type = false;

    template <typename T>
    struct is_optional : std::false_type {};
    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    struct is_vector : std::false_type {};
    template <typename T, typename A>
    struct is_vector<std::vector<T, A>> : std::true_type {};

    template <typename T>
    struct is_map : std::false_type {};
    template <typename K, typename V, typename C, typename A>
    struct is_map<std::map<K, V, C, A>> : std::true_type {};
    template <typename K, typename V, typename H, typename E, typename A>
    struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

    template <typename T>
    struct is_set : std::false_type {};
    template <typename T, typename C, typename A>
    struct is_set<std::set<T, C, A>> : std::true_type {};

    template <typename T>
    IntegerWidth integer_width() {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) return IntegerWidth::Int8;
            else if constexpr (sizeof(T) == 2) return IntegerWidth::Int16;
            else return IntegerWidth::Int;
        } else {
            if constexpr (sizeof(T) == 1) return IntegerWidth::UInt8;
            else if constexpr (sizeof(T) == 2) return IntegerWidth::UInt16;
            else if constexpr (sizeof(T) == 4) return IntegerWidth::UInt32;
            else return IntegerWidth::UInt;
        }
    }

    template <typename T>
    Value make_record(const T& value) {
        using R = Reflection<T>;
        std::vector<Member> members;
        std::apply([&](const auto&... fields) {
            (members.emplace_back(fields.label, make_value(value.*(fields.pointer))), ...);
        }, R::members);
        return Value::record(R::type_name, std::move(members));
    }

} // namespace detail

/**
 * Convert a native value into a Value tree.
 *
 * Integer widths: 8 and 16 bit types keep their width, wider signed types map
 * to Int, unsigned 32 bit to UInt32 and wider unsigned types to UInt.
 * `char` becomes a Character, system_clock time points become Dates.
 */
template <typename T>
Value make_value(const T& value) {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (std::is_same_v<T, bool>) {
        return Value::boolean(value);
    } else if constexpr (std::is_same_v<T, char>) {
        return Value::character(std::string(1, value));
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (std::is_signed_v<T>) {
            return Value::integer(static_cast<std::int64_t>(value), detail::integer_width<T>());
        } else {
            return Value::unsigned_integer(static_cast<std::uint64_t>(value),
                                           detail::integer_width<T>());
        }
    } else if constexpr (std::is_same_v<T, float>) {
        return Value::floating(value, FloatWidth::Float);
    } else if constexpr (std::is_floating_point_v<T>) {
        return Value::floating(static_cast<double>(value), FloatWidth::Double);
    } else if constexpr (std::is_convertible_v<T, std::string_view>) {
        return Value::string(std::string(std::string_view(value)));
    } else if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>) {
        using seconds = std::chrono::duration<double>;
        return Value::date(std::chrono::duration_cast<seconds>(value.time_since_epoch()).count());
    } else if constexpr (detail::is_optional<T>::value) {
        return value.has_value() ? make_value(*value) : Value::nil();
    } else if constexpr (detail::is_vector<T>::value) {
        std::vector<Value> elements;
        elements.reserve(value.size());
        for (const auto& element : value) {
            elements.push_back(make_value(element));
        }
        return Value::sequence(std::move(elements));
    } else if constexpr (detail::is_map<T>::value) {
        std::vector<std::pair<Value, Value>> entries;
        entries.reserve(value.size());
        for (const auto& [key, mapped] : value) {
            entries.emplace_back(make_value(key), make_value(mapped));
        }
        return Value::map(std::move(entries));
    } else if constexpr (detail::is_set<T>::value) {
        std::vector<Value> elements;
        for (const auto& element : value) {
            elements.push_back(make_value(element));
        }
        return Value::set(std::move(elements));
    } else if constexpr (ReflectedEnum<T>) {
        return Value::enumeration(Reflection<T>::type_name, Reflection<T>::case_name(value));
    } else if constexpr (ReflectedRecord<T>) {
        return detail::make_record(value);
    } else {
        static_assert(detail::unsupported_native_type<T>,
                      "make_value: specialize snapfix::Reflection<T> for this type");
    }
}

} // namespace snapfix
