//
// Built-in Literal Renderers
//
// Swift expression text for primitive and Foundation values. Each function
// has the RenderFn signature so it can be registered directly, and custom
// renderers can delegate to them.
//

#pragma once

#include <snapfix/render_context.hh>
#include <snapfix/value.hh>

#include <optional>
#include <string>

namespace snapfix::builtin {

/// `true` / `false`
std::string render_bool(const Value& value, const RenderContext& ctx);

/// `42` for Int, `Int8(-5)`, `UInt64(42)` for the other widths
std::string render_integer(const Value& value, const RenderContext& ctx);

/// Shortest round-trip literal, or `Double.nan` / `Float.infinity` etc.
std::string render_floating(const Value& value, const RenderContext& ctx);

/// @throws reflection_error on malformed UTF-8
std::string render_string(const Value& value, const RenderContext& ctx);
std::string render_character(const Value& value, const RenderContext& ctx);

std::string render_date(const Value& value, const RenderContext& ctx);
std::string render_uuid(const Value& value, const RenderContext& ctx);
std::string render_url(const Value& value, const RenderContext& ctx);

/// @throws reflection_error if the description is not a decimal numeral
std::string render_decimal(const Value& value, const RenderContext& ctx);

/// Hex byte array up to the inline threshold, base64 above it
std::string render_data(const Value& value, const RenderContext& ctx);

/**
 * Dispatch on kind to the functions above.
 *
 * @return nullopt when value is not a primitive or Foundation value
 */
std::optional<std::string> render_builtin(const Value& value, const RenderContext& ctx);

} // namespace snapfix::builtin
