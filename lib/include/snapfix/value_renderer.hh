//
// Value Renderer
//
// Recursive dispatcher turning a Value into Swift expression text.
//

#pragma once

#include <snapfix/render_context.hh>
#include <snapfix/value.hh>

#include <string>

namespace snapfix {

/**
 * Render a value as a Swift expression (possibly multi-line, no terminator).
 *
 * Resolution order per node:
 *   1. depth ceiling and Object cycle guard
 *   2. nil
 *   3. registered renderer for value.type_key()
 *   4. type descriptor (records and objects)
 *   5. built-in primitive and Foundation handlers
 *   6. collections (arrays, dictionaries, sets, named collections)
 *   7. structural reflection (records, enums, objects)
 *
 * @throws snapshot_error subclass raised at the failing node, carrying its path
 */
std::string render_value(const Value& value, const RenderContext& ctx);

} // namespace snapfix
