//
// Expression Layout Helpers
//
// Assemble rendered child expressions into list literals and call
// expressions. Nested lines are indented by four spaces and elements are
// separated by commas; CodeFormatter later re-indents and adds the
// trailing comma of multi-line lists.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace snapfix::layout {

/// Maximum width of a call kept on one line
inline constexpr std::size_t kInlineCallWidth = 80;

[[nodiscard]] bool is_multiline(const std::string& text);

/// Prefix every line of text with one indentation level
[[nodiscard]] std::string indent_lines(const std::string& text);

/**
 * `open close` when empty, `open item close` for one item, otherwise one
 * item per line between open and close.
 */
[[nodiscard]] std::string list(const std::string& open,
                               const std::vector<std::string>& items,
                               const std::string& close);

/**
 * `callee(a, b)` when every argument is single-line and the result fits in
 * kInlineCallWidth columns, otherwise one argument per line.
 */
[[nodiscard]] std::string call(const std::string& callee,
                               const std::vector<std::string>& arguments);

/// `label: expr`, or expr alone for positional arguments
[[nodiscard]] std::string argument(const std::string* label, const std::string& expr);

} // namespace snapfix::layout
