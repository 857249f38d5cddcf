#include <snapfix/codegen/fixture_writer.hh>

#include <sstream>
#include <stdexcept>

namespace snapfix::codegen {

namespace {

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream input(text);
        std::string line;
        while (std::getline(input, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }
        return lines;
    }

    std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

} // anonymous namespace

FixtureWriter::FixtureWriter(std::ostream& output)
    : writer_(output) {
}

// ============================================================================
// Declarations
// ============================================================================

void FixtureWriter::start_extension(const std::string& type_name) {
    block_stack_.push_back(writer_.write_block("extension " + type_name));
}

void FixtureWriter::end_extension() {
    if (block_stack_.empty()) {
        throw std::logic_error("end_extension() without matching start_extension()");
    }
    block_stack_.pop_back();
}

void FixtureWriter::write_static_let(const std::string& name,
                                     const std::string& type_name,
                                     const std::string& expression) {
    writer_.write_lines("static let " + name + ": " + type_name + " = " + expression);
}

// ============================================================================
// Comments and Preamble
// ============================================================================

void FixtureWriter::write_header(const std::string& header) {
    for (const auto& line : split_lines(header)) {
        if (line.rfind("//", 0) == 0) {
            writer_.write_line(line);
        } else if (line.empty()) {
            writer_.write_line("//");
        } else {
            writer_.write_line("// " + line);
        }
    }
    writer_.write_blank_line();
}

void FixtureWriter::write_doc_comment(const std::string& text) {
    for (const auto& line : split_lines(text)) {
        const std::string trimmed = trim(line);
        writer_.write_line(trimmed.empty() ? "///" : "/// " + trimmed);
    }
}

void FixtureWriter::write_import(const std::string& module) {
    writer_.write_line("import " + module);
}

void FixtureWriter::write_blank_line() {
    writer_.write_blank_line();
}

// ============================================================================
// Whole file
// ============================================================================

std::string build_fixture_source(const FixtureSource& source) {
    std::ostringstream output;
    {
        FixtureWriter writer(output);
        if (source.header && !source.header->empty()) {
            writer.write_header(*source.header);
        }
        writer.write_import("Foundation");
        writer.write_blank_line();

        writer.start_extension(source.type_name);
        if (source.context && !source.context->empty()) {
            writer.write_doc_comment(*source.context);
        }
        writer.write_static_let(source.variable_name, source.type_name, source.expression);
        writer.end_extension();
    }
    return output.str();
}

}  // namespace snapfix::codegen
