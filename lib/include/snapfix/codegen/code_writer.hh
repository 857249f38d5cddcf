//
// Code Writer
//
// Line-oriented writer with indentation management. BraceBlock guards
// open a `header {` block and close it with `}` when they go out of scope,
// so blocks can never be left unbalanced.
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace snapfix::codegen {

class BraceBlock;

// ============================================================================
// CodeWriter
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    /// One line at the current indentation; an empty line gets no indentation
    void write_line(const std::string& line);

    /// Every line of a multi-line text at the current indentation
    void write_lines(const std::string& text);

    void write_blank_line();

    /// `header {`, with `}` written when the returned guard closes
    BraceBlock write_block(const std::string& header);

    void indent();
    void unindent();
    std::size_t current_indent_level() const { return indent_level_; }

private:
    std::ostream& output_;
    std::size_t indent_level_ = 0;
    std::string indent_prefix_;
};

// ============================================================================
// BraceBlock - RAII guard for braced declarations
// ============================================================================

class BraceBlock {
public:
    BraceBlock(CodeWriter* writer, const std::string& header);
    ~BraceBlock();

    BraceBlock(const BraceBlock&) = delete;
    BraceBlock& operator=(const BraceBlock&) = delete;
    BraceBlock(BraceBlock&& other) noexcept;
    BraceBlock& operator=(BraceBlock&& other) noexcept;

    // Close the block before the guard goes out of scope
    void close();

private:
    CodeWriter* writer_;
};

}  // namespace snapfix::codegen
