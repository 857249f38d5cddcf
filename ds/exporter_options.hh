#pragma once

#include <snapfix/render_options.hh>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapfix::driver {

/// Exporter options (driver configuration only)
struct ExporterOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // YAML documents
    std::optional<std::filesystem::path> output_dir; // -o, --output
    std::optional<std::string> variable_name;        // -n, --name (single input only)
    std::optional<std::string> type_name;            // -t, --type
    std::optional<std::string> file_name;            // --file
    bool allow_overwrite = true;                     // --no-overwrite
    bool to_stdout = false;                          // --stdout

    // ========================================================================
    // Fixture Content
    // ========================================================================

    std::optional<std::string> header;               // --header
    std::optional<std::string> context;              // --context

    // ========================================================================
    // Formatting and Rendering
    // ========================================================================

    FormatProfile format_profile;
    RenderOptions render_options;

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    bool debug = false;                              // --debug
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
ExporterOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace snapfix::driver
