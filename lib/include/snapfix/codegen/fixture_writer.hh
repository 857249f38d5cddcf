#pragma once

#include <snapfix/codegen/code_writer.hh>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace snapfix::codegen {

/**
 * FixtureWriter - assembles a Swift fixture source file
 *
 * Wraps CodeWriter and keeps the RAII blocks of open declarations on a
 * stack, so start/end calls can be issued separately.
 *
 * Usage:
 *   FixtureWriter w(output_stream);
 *   w.write_header("Generated fixture");
 *   w.write_import("Foundation");
 *   w.write_blank_line();
 *   w.start_extension("User");
 *   w.write_doc_comment("Logged-in user");
 *   w.write_static_let("alice", "User", "User(id: 1)");
 *   w.end_extension();
 */
class FixtureWriter {
public:
    explicit FixtureWriter(std::ostream& output);

    // ========================================================================
    // Declarations
    // ========================================================================

    void start_extension(const std::string& type_name);
    void end_extension();

    /// `static let name: Type = expression` (expression may span lines)
    void write_static_let(const std::string& name,
                          const std::string& type_name,
                          const std::string& expression);

    // ========================================================================
    // Comments and Preamble
    // ========================================================================

    /// Each header line as a `//` comment (lines already starting with `//` kept), then a blank line
    void write_header(const std::string& header);

    /// Each line as a `///` doc comment, trimmed; empty lines become `///`
    void write_doc_comment(const std::string& text);

    void write_import(const std::string& module);
    void write_blank_line();

private:
    CodeWriter writer_;

    // Stack of open declaration blocks
    std::vector<BraceBlock> block_stack_;
};

/// Everything that goes into one fixture file
struct FixtureSource {
    std::string type_name;
    std::string variable_name;
    std::string expression;
    std::optional<std::string> header;
    std::optional<std::string> context;
};

/// Unformatted fixture file text (run CodeFormatter::format over it)
std::string build_fixture_source(const FixtureSource& source);

}  // namespace snapfix::codegen
