//
// Code Formatter
//
// Purely syntactic layout pass over generated Swift text.
//

#pragma once

#include <snapfix/render_options.hh>

#include <string>

namespace snapfix::codegen {

class CodeFormatter {
public:
    /**
     * Lay out text according to profile.
     *
     * Steps, in order:
     * - normalize `\r\n` and `\r` to `\n`
     * - trim trailing spaces and tabs (trim_trailing_whitespace)
     * - re-indent each line from bracket nesting; brackets inside string
     *   literals and `//` comments are ignored, all brackets opened on one
     *   line count as one level, leading closers dedent their own line
     * - add the trailing comma after the last element of multi-line
     *   `[...]` and `(...)` lists
     * - exactly one final newline, or none (insert_final_newline)
     * - convert to the profile line ending
     *
     * format(format(t, p), p) == format(t, p).
     *
     * @throws formatting_error on unbalanced brackets or an unterminated
     *         string literal
     */
    static std::string format(const std::string& text, const FormatProfile& profile);
};

} // namespace snapfix::codegen
