//
// Value Model Implementation
//

#include <snapfix/value.hh>
#include <snapfix/canonical.hh>
#include <limits>
#include <stdexcept>

namespace snapfix {

namespace {

    bool is_unsigned_width(IntegerWidth width) {
        switch (width) {
            case IntegerWidth::UInt:
            case IntegerWidth::UInt8:
            case IntegerWidth::UInt16:
            case IntegerWidth::UInt32:
            case IntegerWidth::UInt64:
                return true;
            default:
                return false;
        }
    }

    template <typename T>
    bool fits(std::int64_t value) {
        return value >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
               value <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
    }

    [[noreturn]] void wrong_kind(const char* accessor, Value::Kind actual) {
        throw std::logic_error(std::string("Value::") + accessor +
                               " called on " + kind_name(actual) + " value");
    }

} // anonymous namespace

// ============================================================================
// Integer
// ============================================================================

bool Integer::is_signed() const {
    return !is_unsigned_width(width);
}

std::string Integer::to_string() const {
    return is_signed() ? std::to_string(signed_value) : std::to_string(unsigned_value);
}

// ============================================================================
// Construction
// ============================================================================

Value::Value()
    : kind_(Kind::Nil), payload_(std::monostate{})
{
}

Value::Value(Kind kind, Payload payload)
    : kind_(kind), payload_(std::move(payload))
{
}

Value Value::nil() {
    return Value();
}

Value Value::boolean(bool value) {
    return Value(Kind::Bool, Payload(std::in_place_type<bool>, value));
}

Value Value::integer(std::int64_t value, IntegerWidth width) {
    if (is_unsigned_width(width)) {
        if (value < 0) {
            throw std::invalid_argument(std::string("negative value for ") +
                                        integer_width_name(width));
        }
        return unsigned_integer(static_cast<std::uint64_t>(value), width);
    }

    bool in_range = true;
    switch (width) {
        case IntegerWidth::Int8:  in_range = fits<std::int8_t>(value);  break;
        case IntegerWidth::Int16: in_range = fits<std::int16_t>(value); break;
        case IntegerWidth::Int32: in_range = fits<std::int32_t>(value); break;
        default: break;
    }
    if (!in_range) {
        throw std::invalid_argument(std::to_string(value) + " does not fit into " +
                                    integer_width_name(width));
    }

    Integer payload;
    payload.width = width;
    payload.signed_value = value;
    return Value(Kind::Integer, payload);
}

Value Value::unsigned_integer(std::uint64_t value, IntegerWidth width) {
    if (!is_unsigned_width(width)) {
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::invalid_argument(std::to_string(value) + " does not fit into " +
                                        integer_width_name(width));
        }
        return integer(static_cast<std::int64_t>(value), width);
    }

    std::uint64_t limit = std::numeric_limits<std::uint64_t>::max();
    switch (width) {
        case IntegerWidth::UInt8:  limit = std::numeric_limits<std::uint8_t>::max();  break;
        case IntegerWidth::UInt16: limit = std::numeric_limits<std::uint16_t>::max(); break;
        case IntegerWidth::UInt32: limit = std::numeric_limits<std::uint32_t>::max(); break;
        default: break;
    }
    if (value > limit) {
        throw std::invalid_argument(std::to_string(value) + " does not fit into " +
                                    integer_width_name(width));
    }

    Integer payload;
    payload.width = width;
    payload.unsigned_value = value;
    return Value(Kind::Integer, payload);
}

Value Value::floating(double value, FloatWidth width) {
    if (width == FloatWidth::Float) {
        value = static_cast<double>(static_cast<float>(value));
    }
    return Value(Kind::Floating, Floating{width, value});
}

Value Value::string(std::string text) {
    return Value(Kind::String, Payload(std::in_place_type<std::string>, std::move(text)));
}

Value Value::character(std::string grapheme) {
    if (grapheme.empty()) {
        throw std::invalid_argument("character value must not be empty");
    }
    if (!is_single_grapheme(grapheme)) {
        throw std::invalid_argument("character value must hold a single character: " + grapheme);
    }
    return Value(Kind::Character, std::move(grapheme));
}

Value Value::date(double seconds_since_epoch) {
    return Value(Kind::Date, Payload(std::in_place_type<double>, seconds_since_epoch));
}

Value Value::uuid(const Uuid& bytes) {
    return Value(Kind::Uuid, bytes);
}

Value Value::url(std::string text) {
    return Value(Kind::Url, std::move(text));
}

Value Value::decimal(std::string description) {
    return Value(Kind::Decimal, std::move(description));
}

Value Value::data(Bytes bytes) {
    return Value(Kind::Data, std::make_shared<const Bytes>(std::move(bytes)));
}

Value Value::sequence(std::vector<Value> elements) {
    return Value(Kind::Sequence,
                 std::make_shared<const SequenceData>(SequenceData{"", std::move(elements)}));
}

Value Value::map(std::vector<std::pair<Value, Value>> entries) {
    return Value(Kind::Map, std::make_shared<const MapData>(MapData{std::move(entries)}));
}

Value Value::set(std::vector<Value> elements) {
    return Value(Kind::Set,
                 std::make_shared<const SequenceData>(SequenceData{"", std::move(elements)}));
}

Value Value::collection(std::string type_name, std::vector<Value> elements) {
    return Value(Kind::Collection,
                 std::make_shared<const SequenceData>(
                     SequenceData{std::move(type_name), std::move(elements)}));
}

Value Value::record(std::string type_name, std::vector<Member> members) {
    return Value(Kind::Record,
                 std::make_shared<const RecordData>(
                     RecordData{std::move(type_name), std::move(members)}));
}

Value Value::enumeration(std::string type_name, std::string case_name,
                         std::vector<Member> payload) {
    EnumData data;
    data.type_name = std::move(type_name);
    data.case_name = std::move(case_name);
    data.payload = std::move(payload);
    return Value(Kind::Enum, std::make_shared<const EnumData>(std::move(data)));
}

Value Value::raw_enumeration(std::string type_name, std::string case_name, Value raw_value) {
    EnumData data;
    data.type_name = std::move(type_name);
    data.case_name = std::move(case_name);
    data.raw_value = std::move(raw_value);
    return Value(Kind::Enum, std::make_shared<const EnumData>(std::move(data)));
}

Value Value::object(std::shared_ptr<Object> object) {
    if (!object) {
        throw std::invalid_argument("object value requires a non-null object");
    }
    return Value(Kind::Object, std::move(object));
}

Value Value::opaque(std::string type_name, std::any payload) {
    return Value(Kind::Opaque,
                 std::make_shared<const OpaqueData>(
                     OpaqueData{std::move(type_name), std::move(payload)}));
}

// ============================================================================
// Inspection
// ============================================================================

std::string Value::type_key() const {
    switch (kind_) {
        case Kind::Nil:        return "Optional";
        case Kind::Bool:       return "Bool";
        case Kind::Integer:    return integer_width_name(as_integer().width);
        case Kind::Floating:
            return as_floating().width == FloatWidth::Float ? "Float" : "Double";
        case Kind::String:     return "String";
        case Kind::Character:  return "Character";
        case Kind::Date:       return "Date";
        case Kind::Uuid:       return "UUID";
        case Kind::Url:        return "URL";
        case Kind::Decimal:    return "Decimal";
        case Kind::Data:       return "Data";
        case Kind::Sequence:   return "Array";
        case Kind::Map:        return "Dictionary";
        case Kind::Set:        return "Set";
        case Kind::Collection:
        case Kind::Record:
        case Kind::Enum:
        case Kind::Object:
        case Kind::Opaque:
            return type_name();
    }
    return "Unknown";
}

bool Value::as_bool() const {
    if (kind_ != Kind::Bool) wrong_kind("as_bool", kind_);
    return std::get<bool>(payload_);
}

const Integer& Value::as_integer() const {
    if (kind_ != Kind::Integer) wrong_kind("as_integer", kind_);
    return std::get<Integer>(payload_);
}

const Floating& Value::as_floating() const {
    if (kind_ != Kind::Floating) wrong_kind("as_floating", kind_);
    return std::get<Floating>(payload_);
}

const std::string& Value::as_text() const {
    switch (kind_) {
        case Kind::String:
        case Kind::Character:
        case Kind::Url:
        case Kind::Decimal:
            return std::get<std::string>(payload_);
        default:
            wrong_kind("as_text", kind_);
    }
}

double Value::as_date() const {
    if (kind_ != Kind::Date) wrong_kind("as_date", kind_);
    return std::get<double>(payload_);
}

const Uuid& Value::as_uuid() const {
    if (kind_ != Kind::Uuid) wrong_kind("as_uuid", kind_);
    return std::get<Uuid>(payload_);
}

const Bytes& Value::as_bytes() const {
    if (kind_ != Kind::Data) wrong_kind("as_bytes", kind_);
    return *std::get<std::shared_ptr<const Bytes>>(payload_);
}

const std::vector<Value>& Value::elements() const {
    switch (kind_) {
        case Kind::Sequence:
        case Kind::Set:
        case Kind::Collection:
            return std::get<std::shared_ptr<const SequenceData>>(payload_)->elements;
        default:
            wrong_kind("elements", kind_);
    }
}

const std::vector<std::pair<Value, Value>>& Value::entries() const {
    if (kind_ != Kind::Map) wrong_kind("entries", kind_);
    return std::get<std::shared_ptr<const MapData>>(payload_)->entries;
}

const std::string& Value::type_name() const {
    switch (kind_) {
        case Kind::Collection:
            return std::get<std::shared_ptr<const SequenceData>>(payload_)->type_name;
        case Kind::Record:
            return std::get<std::shared_ptr<const RecordData>>(payload_)->type_name;
        case Kind::Enum:
            return std::get<std::shared_ptr<const EnumData>>(payload_)->type_name;
        case Kind::Object:
            return std::get<std::shared_ptr<Object>>(payload_)->type_name();
        case Kind::Opaque:
            return std::get<std::shared_ptr<const OpaqueData>>(payload_)->type_name;
        default:
            wrong_kind("type_name", kind_);
    }
}

const std::vector<Member>& Value::members() const {
    switch (kind_) {
        case Kind::Record:
            return std::get<std::shared_ptr<const RecordData>>(payload_)->members;
        case Kind::Enum:
            return std::get<std::shared_ptr<const EnumData>>(payload_)->payload;
        case Kind::Object:
            return std::get<std::shared_ptr<Object>>(payload_)->members();
        default:
            wrong_kind("members", kind_);
    }
}

const EnumData& Value::as_enum() const {
    if (kind_ != Kind::Enum) wrong_kind("as_enum", kind_);
    return *std::get<std::shared_ptr<const EnumData>>(payload_);
}

const std::shared_ptr<Object>& Value::as_object() const {
    if (kind_ != Kind::Object) wrong_kind("as_object", kind_);
    return std::get<std::shared_ptr<Object>>(payload_);
}

const std::any& Value::opaque_payload() const {
    if (kind_ != Kind::Opaque) wrong_kind("opaque_payload", kind_);
    return std::get<std::shared_ptr<const OpaqueData>>(payload_)->payload;
}

// ============================================================================
// Object
// ============================================================================

Object::Object(std::string type_name)
    : type_name_(std::move(type_name))
{
}

void Object::add_member(std::string label, Value value) {
    members_.emplace_back(std::move(label), std::move(value));
}

void Object::add_member(Value value) {
    members_.emplace_back(std::move(value));
}

void Object::clear() {
    members_.clear();
}

// ============================================================================
// Names
// ============================================================================

const char* kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::Nil:        return "nil";
        case Value::Kind::Bool:       return "bool";
        case Value::Kind::Integer:    return "integer";
        case Value::Kind::Floating:   return "floating";
        case Value::Kind::String:     return "string";
        case Value::Kind::Character:  return "character";
        case Value::Kind::Date:       return "date";
        case Value::Kind::Uuid:       return "uuid";
        case Value::Kind::Url:        return "url";
        case Value::Kind::Decimal:    return "decimal";
        case Value::Kind::Data:       return "data";
        case Value::Kind::Sequence:   return "sequence";
        case Value::Kind::Map:        return "map";
        case Value::Kind::Set:        return "set";
        case Value::Kind::Collection: return "collection";
        case Value::Kind::Record:     return "record";
        case Value::Kind::Enum:       return "enum";
        case Value::Kind::Object:     return "object";
        case Value::Kind::Opaque:     return "opaque";
    }
    return "unknown";
}

const char* integer_width_name(IntegerWidth width) {
    switch (width) {
        case IntegerWidth::Int:    return "Int";
        case IntegerWidth::Int8:   return "Int8";
        case IntegerWidth::Int16:  return "Int16";
        case IntegerWidth::Int32:  return "Int32";
        case IntegerWidth::Int64:  return "Int64";
        case IntegerWidth::UInt:   return "UInt";
        case IntegerWidth::UInt8:  return "UInt8";
        case IntegerWidth::UInt16: return "UInt16";
        case IntegerWidth::UInt32: return "UInt32";
        case IntegerWidth::UInt64: return "UInt64";
    }
    return "Int";
}

} // namespace snapfix
