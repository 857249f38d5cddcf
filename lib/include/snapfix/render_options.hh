//
// Render Options and Format Profile
//

#pragma once

#include <cstddef>
#include <string>

namespace snapfix {

/// Options consulted by the value renderer
struct RenderOptions {
    bool sort_map_keys = true;                  ///< Order map entries by rendered key text
    bool deterministic_set_order = true;        ///< Order set elements by rendered text
    std::size_t inline_binary_threshold = 16;   ///< Max byte count rendered as a hex array
    bool force_enum_shorthand = true;           ///< Prefer `.case` over `TypeName.case`
    std::size_t max_depth = 256;                ///< Recursion ceiling (depth_limit_error above it)

    bool operator==(const RenderOptions&) const = default;
};

enum class IndentStyle {
    Space,
    Tab
};

enum class LineEnding {
    LF,
    CRLF
};

/// Layout settings applied by CodeFormatter
struct FormatProfile {
    IndentStyle indent_style = IndentStyle::Space;
    std::size_t indent_width = 4;               ///< Spaces per level (ignored for tabs)
    LineEnding line_ending = LineEnding::LF;
    bool insert_final_newline = true;
    bool trim_trailing_whitespace = true;

    bool operator==(const FormatProfile&) const = default;

    /// One indentation level as text
    [[nodiscard]] std::string indent_unit() const {
        return indent_style == IndentStyle::Tab ? std::string("\t")
                                                : std::string(indent_width, ' ');
    }
};

} // namespace snapfix
