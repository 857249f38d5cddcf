//
// Code Writer Implementation
//

#include <snapfix/codegen/code_writer.hh>

namespace snapfix::codegen {

namespace {

    // Emitted text is re-indented by CodeFormatter, so one fixed unit suffices
    constexpr const char* kIndentUnit = "    ";

} // anonymous namespace

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output)
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << indent_prefix_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_lines(const std::string& text) {
    std::size_t start = 0;
    std::size_t end = text.find('\n');
    while (end != std::string::npos) {
        write_line(text.substr(start, end - start));
        start = end + 1;
        end = text.find('\n', start);
    }
    write_line(text.substr(start));
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

BraceBlock CodeWriter::write_block(const std::string& header) {
    return BraceBlock(this, header);
}

void CodeWriter::indent() {
    ++indent_level_;
    indent_prefix_ += kIndentUnit;
}

void CodeWriter::unindent() {
    if (indent_level_ == 0) {
        return;
    }
    --indent_level_;
    indent_prefix_.resize(indent_level_ * std::char_traits<char>::length(kIndentUnit));
}

// ============================================================================
// BraceBlock
// ============================================================================

BraceBlock::BraceBlock(CodeWriter* writer, const std::string& header)
    : writer_(writer)
{
    writer_->write_line(header + " {");
    writer_->indent();
}

BraceBlock::~BraceBlock() {
    close();
}

BraceBlock::BraceBlock(BraceBlock&& other) noexcept
    : writer_(other.writer_)
{
    other.writer_ = nullptr;
}

BraceBlock& BraceBlock::operator=(BraceBlock&& other) noexcept {
    if (this != &other) {
        close();
        writer_ = other.writer_;
        other.writer_ = nullptr;
    }
    return *this;
}

void BraceBlock::close() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
        writer_ = nullptr;
    }
}

}  // namespace snapfix::codegen
