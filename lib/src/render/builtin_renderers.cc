//
// Built-in Literal Renderers Implementation
//

#include <snapfix/builtin_renderers.hh>
#include <snapfix/canonical.hh>
#include <snapfix/errors.hh>

#include <cmath>

namespace snapfix::builtin {

namespace {

    std::string quote_or_throw(const std::string& text, const RenderContext& ctx) {
        auto literal = quote_string_literal(text);
        if (!literal) {
            throw reflection_error("string is not valid UTF-8", ctx.path());
        }
        return *literal;
    }

    std::string non_finite(double value, const char* type_name) {
        if (std::isnan(value)) {
            return std::string(type_name) + ".nan";
        }
        return std::string(value < 0 ? "-" : "") + type_name + ".infinity";
    }

} // anonymous namespace

// ============================================================================
// Primitives
// ============================================================================

std::string render_bool(const Value& value, const RenderContext&) {
    return value.as_bool() ? "true" : "false";
}

std::string render_integer(const Value& value, const RenderContext&) {
    const Integer& integer = value.as_integer();
    if (integer.width == IntegerWidth::Int) {
        return integer.to_string();
    }
    return std::string(integer_width_name(integer.width)) + "(" + integer.to_string() + ")";
}

std::string render_floating(const Value& value, const RenderContext&) {
    const Floating& floating = value.as_floating();
    const bool is_float = floating.width == FloatWidth::Float;

    if (!std::isfinite(floating.value)) {
        return non_finite(floating.value, is_float ? "Float" : "Double");
    }
    return is_float ? format_float(static_cast<float>(floating.value))
                    : format_double(floating.value);
}

std::string render_string(const Value& value, const RenderContext& ctx) {
    return quote_or_throw(value.as_text(), ctx);
}

std::string render_character(const Value& value, const RenderContext& ctx) {
    return "Character(" + quote_or_throw(value.as_text(), ctx) + ")";
}

// ============================================================================
// Foundation types
// ============================================================================

std::string render_date(const Value& value, const RenderContext&) {
    const double seconds = value.as_date();
    const std::string interval = std::isfinite(seconds) ? format_double(seconds)
                                                        : non_finite(seconds, "Double");
    return "Date(timeIntervalSince1970: " + interval + ")";
}

std::string render_uuid(const Value& value, const RenderContext&) {
    return "UUID(uuidString: \"" + format_uuid(value.as_uuid()) + "\")!";
}

std::string render_url(const Value& value, const RenderContext& ctx) {
    return "URL(string: " + quote_or_throw(value.as_text(), ctx) + ")!";
}

std::string render_decimal(const Value& value, const RenderContext& ctx) {
    const std::string& description = value.as_text();
    if (!is_decimal_numeral(description)) {
        throw reflection_error("invalid decimal description '" + description + "'", ctx.path());
    }
    return "Decimal(string: \"" + description + "\")!";
}

std::string render_data(const Value& value, const RenderContext& ctx) {
    const Bytes& bytes = value.as_bytes();

    if (bytes.size() > ctx.options().inline_binary_threshold) {
        return "Data(base64Encoded: \"" + base64_encode(bytes) + "\")!";
    }

    std::string text = "Data([";
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += format_hex_byte(bytes[i]);
    }
    text += "])";
    return text;
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<std::string> render_builtin(const Value& value, const RenderContext& ctx) {
    switch (value.kind()) {
        case Value::Kind::Bool:      return render_bool(value, ctx);
        case Value::Kind::Integer:   return render_integer(value, ctx);
        case Value::Kind::Floating:  return render_floating(value, ctx);
        case Value::Kind::String:    return render_string(value, ctx);
        case Value::Kind::Character: return render_character(value, ctx);
        case Value::Kind::Date:      return render_date(value, ctx);
        case Value::Kind::Uuid:      return render_uuid(value, ctx);
        case Value::Kind::Url:       return render_url(value, ctx);
        case Value::Kind::Decimal:   return render_decimal(value, ctx);
        case Value::Kind::Data:      return render_data(value, ctx);
        default:
            return std::nullopt;
    }
}

} // namespace snapfix::builtin
