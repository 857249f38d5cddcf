//
// Reflection Fallback
//
// Structural rendering of records, enums and objects from their members,
// with or without a type descriptor.
//

#pragma once

#include <snapfix/render_context.hh>
#include <snapfix/type_descriptor.hh>
#include <snapfix/value.hh>

#include <string>

namespace snapfix {

/**
 * Render a Record, Enum or Object from its members.
 *
 * Records and objects become `TypeName(label: expr, expr)`; enums become
 * `.case`, `TypeName.case`, `.case(payload)` or `TypeName(rawValue: raw)!`.
 *
 * @throws unsupported_type_error for any other kind
 */
std::string reflect_value(const Value& value, const RenderContext& ctx);

/**
 * Render a Record or Object through its descriptor: render_fn output
 * verbatim, otherwise members with renames, redactions and ignored
 * properties applied.
 *
 * @throws reflection_error if a descriptor property names a missing member
 */
std::string render_with_descriptor(const Value& value,
                                   const TypeDescriptor& descriptor,
                                   const RenderContext& ctx);

} // namespace snapfix
