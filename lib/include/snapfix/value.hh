//
// Value Model
//
// Closed set of runtime value variants the renderer understands.
// A Value is an immutable, cheaply copyable handle; composite payloads
// are shared between copies.
//

#pragma once

#include <any>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace snapfix {

/// Width tag for integer values (maps 1:1 to the emitted Swift integer type)
enum class IntegerWidth {
    Int, Int8, Int16, Int32, Int64,
    UInt, UInt8, UInt16, UInt32, UInt64
};

/// Width tag for floating point values
enum class FloatWidth {
    Double,
    Float
};

using Uuid = std::array<std::uint8_t, 16>;
using Bytes = std::vector<std::uint8_t>;

/// Integer payload. Signed widths use signed_value, unsigned widths unsigned_value.
struct Integer {
    IntegerWidth width = IntegerWidth::Int;
    std::int64_t signed_value = 0;
    std::uint64_t unsigned_value = 0;

    [[nodiscard]] bool is_signed() const;
    [[nodiscard]] std::string to_string() const;
};

struct Floating {
    FloatWidth width = FloatWidth::Double;
    double value = 0.0;
};

class Value;
struct Member;
class Object;

// Composite payloads (defined below, after Value is complete)
struct SequenceData;
struct MapData;
struct RecordData;
struct EnumData;
struct OpaqueData;

/**
 * Immutable handle to a runtime value and its runtime type identity.
 *
 * The kinds fall into the categories the dispatcher visits:
 * - Optional:          Nil
 * - Primitive:         Bool, Integer, Floating, String, Character
 * - StructuredBuiltin: Date, Uuid, Url, Decimal, Data
 * - Collection:        Sequence, Map, Set, Collection
 * - StructuralRecord:  Record, Enum, Object
 * - CustomRegistered:  Opaque
 */
class Value {
public:
    enum class Kind {
        Nil,
        Bool,
        Integer,
        Floating,
        String,
        Character,
        Date,
        Uuid,
        Url,
        Decimal,
        Data,
        Sequence,
        Map,
        Set,
        Collection,
        Record,
        Enum,
        Object,
        Opaque
    };

    /// Default-constructed values are nil
    Value();

    // ========================================================================
    // Factories
    // ========================================================================

    static Value nil();
    static Value boolean(bool value);

    /// @throws std::invalid_argument if value does not fit into width,
    ///         or width is unsigned and value is negative
    static Value integer(std::int64_t value, IntegerWidth width = IntegerWidth::Int);
    static Value unsigned_integer(std::uint64_t value, IntegerWidth width = IntegerWidth::UInt);

    static Value floating(double value, FloatWidth width = FloatWidth::Double);
    static Value string(std::string text);
    /// @throws std::invalid_argument unless grapheme is one user-perceived character
    static Value character(std::string grapheme);

    /// Seconds since 1970-01-01T00:00:00Z
    static Value date(double seconds_since_epoch);
    static Value uuid(const Uuid& bytes);
    static Value url(std::string text);

    /// Arbitrary-precision decimal given by its description ("12.50", "-3")
    static Value decimal(std::string description);
    static Value data(Bytes bytes);

    static Value sequence(std::vector<Value> elements);
    static Value map(std::vector<std::pair<Value, Value>> entries);
    static Value set(std::vector<Value> elements);

    /// Named generic collection, e.g. "IdentifiedArray<Int, User>"
    static Value collection(std::string type_name, std::vector<Value> elements);

    static Value record(std::string type_name, std::vector<Member> members);
    static Value enumeration(std::string type_name, std::string case_name,
                             std::vector<Member> payload = {});
    static Value raw_enumeration(std::string type_name, std::string case_name, Value raw_value);

    /// @throws std::invalid_argument if object is null
    static Value object(std::shared_ptr<Object> object);
    static Value opaque(std::string type_name, std::any payload);

    // ========================================================================
    // Inspection
    // ========================================================================

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_nil() const { return kind_ == Kind::Nil; }

    /// Registry key for this value's concrete type
    [[nodiscard]] std::string type_key() const;

    // Accessors throw std::logic_error when called on the wrong kind
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] const Integer& as_integer() const;
    [[nodiscard]] const Floating& as_floating() const;

    /// Text of String, Character, Url and Decimal values
    [[nodiscard]] const std::string& as_text() const;
    [[nodiscard]] double as_date() const;
    [[nodiscard]] const Uuid& as_uuid() const;
    [[nodiscard]] const Bytes& as_bytes() const;

    /// Elements of Sequence, Set and Collection values
    [[nodiscard]] const std::vector<Value>& elements() const;
    [[nodiscard]] const std::vector<std::pair<Value, Value>>& entries() const;

    /// Type name of Collection, Record, Enum, Object and Opaque values
    [[nodiscard]] const std::string& type_name() const;

    /// Members of Record and Object values, payload of Enum values
    [[nodiscard]] const std::vector<Member>& members() const;

    [[nodiscard]] const EnumData& as_enum() const;
    [[nodiscard]] const std::shared_ptr<Object>& as_object() const;
    [[nodiscard]] const std::any& opaque_payload() const;

    /// Typed access to an opaque payload; nullptr on type mismatch
    template <typename T>
    [[nodiscard]] const T* opaque_as() const {
        return std::any_cast<T>(&opaque_payload());
    }

private:
    using Payload = std::variant<
        std::monostate,
        bool,
        Integer,
        Floating,
        std::string,
        double,
        Uuid,
        std::shared_ptr<const Bytes>,
        std::shared_ptr<const SequenceData>,
        std::shared_ptr<const MapData>,
        std::shared_ptr<const RecordData>,
        std::shared_ptr<const EnumData>,
        std::shared_ptr<Object>,
        std::shared_ptr<const OpaqueData>
    >;

    Value(Kind kind, Payload payload);

    Kind kind_;
    Payload payload_;
};

/// Stored member of a record, object or enum payload. Unlabelled members render positionally.
struct Member {
    std::optional<std::string> label;
    Value value;

    Member() = default;
    Member(std::string member_label, Value member_value)
        : label(std::move(member_label)), value(std::move(member_value)) {}
    explicit Member(Value member_value)
        : value(std::move(member_value)) {}
};

struct SequenceData {
    std::string type_name;
    std::vector<Value> elements;
};

struct MapData {
    std::vector<std::pair<Value, Value>> entries;
};

struct RecordData {
    std::string type_name;
    std::vector<Member> members;
};

struct EnumData {
    std::string type_name;
    std::string case_name;
    std::optional<Value> raw_value;
    std::vector<Member> payload;
};

struct OpaqueData {
    std::string type_name;
    std::any payload;
};

/**
 * Reference-semantics record (class instance).
 *
 * Members can be appended after the object has been wrapped in a Value,
 * which is how cyclic graphs come into existence. The renderer rejects
 * cycles with cycle_error.
 */
class Object {
public:
    explicit Object(std::string type_name);

    const std::string& type_name() const { return type_name_; }
    const std::vector<Member>& members() const { return members_; }

    void add_member(std::string label, Value value);
    void add_member(Value value);

    /// Drop all members (breaks reference cycles held through shared_ptr)
    void clear();

private:
    std::string type_name_;
    std::vector<Member> members_;
};

/// Name of a kind, for diagnostics
const char* kind_name(Value::Kind kind);

/// Swift type name of an integer width ("Int", "UInt8", ...)
const char* integer_width_name(IntegerWidth width);

} // namespace snapfix
