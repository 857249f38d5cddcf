#include "exporter_options.hh"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace snapfix::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) ||
           (long_name && std::strcmp(arg, long_name) == 0);
}

// Value of "--opt value"; advances i past the consumed argument
static std::string take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Option ") + argv[i] + " requires argument");
    }
    return argv[++i];
}

static std::size_t parse_size(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for " + option + ": " + value);
    }
    if (consumed != value.size() || value[0] == '-') {
        throw std::runtime_error("Invalid integer value for " + option + ": " + value);
    }
    return static_cast<std::size_t>(parsed);
}

// ============================================================================
// Main Parser
// ============================================================================

ExporterOptions parse_command_line(int argc, char** argv) {
    ExporterOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (is_option(arg, "-h", "--help")) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (is_option(arg, nullptr, "--version")) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (is_option(arg, "-v", "--verbose")) {
            opts.verbose = true;
            continue;
        }

        if (is_option(arg, nullptr, "--debug")) {
            opts.debug = true;
            continue;
        }

        if (is_option(arg, "-q", "--quiet")) {
            opts.quiet = true;
            continue;
        }

        // Output
        if (is_option(arg, "-o", "--output")) {
            opts.output_dir = take_value(argc, argv, i);
            continue;
        }

        if (is_option(arg, "-n", "--name")) {
            opts.variable_name = take_value(argc, argv, i);
            continue;
        }

        if (is_option(arg, "-t", "--type")) {
            opts.type_name = take_value(argc, argv, i);
            continue;
        }

        if (is_option(arg, nullptr, "--file")) {
            opts.file_name = take_value(argc, argv, i);
            continue;
        }

        if (is_option(arg, nullptr, "--no-overwrite")) {
            opts.allow_overwrite = false;
            continue;
        }

        if (is_option(arg, nullptr, "--stdout")) {
            opts.to_stdout = true;
            continue;
        }

        // Fixture content
        if (is_option(arg, nullptr, "--header")) {
            opts.header = take_value(argc, argv, i);
            continue;
        }

        if (is_option(arg, nullptr, "--context")) {
            opts.context = take_value(argc, argv, i);
            continue;
        }

        // Formatting
        if (is_option(arg, nullptr, "--indent-style")) {
            std::string value = take_value(argc, argv, i);
            if (value == "space") {
                opts.format_profile.indent_style = IndentStyle::Space;
            } else if (value == "tab") {
                opts.format_profile.indent_style = IndentStyle::Tab;
            } else {
                throw std::runtime_error("Invalid choice for --indent-style: " + value +
                                         "\nValid choices: space, tab");
            }
            continue;
        }

        if (is_option(arg, nullptr, "--indent-width")) {
            opts.format_profile.indent_width = parse_size("--indent-width", take_value(argc, argv, i));
            continue;
        }

        if (is_option(arg, nullptr, "--crlf")) {
            opts.format_profile.line_ending = LineEnding::CRLF;
            continue;
        }

        if (is_option(arg, nullptr, "--no-final-newline")) {
            opts.format_profile.insert_final_newline = false;
            continue;
        }

        if (is_option(arg, nullptr, "--keep-trailing-whitespace")) {
            opts.format_profile.trim_trailing_whitespace = false;
            continue;
        }

        // Rendering
        if (is_option(arg, nullptr, "--no-sort-keys")) {
            opts.render_options.sort_map_keys = false;
            continue;
        }

        if (is_option(arg, nullptr, "--no-set-order")) {
            opts.render_options.deterministic_set_order = false;
            continue;
        }

        if (is_option(arg, nullptr, "--inline-threshold")) {
            opts.render_options.inline_binary_threshold =
                parse_size("--inline-threshold", take_value(argc, argv, i));
            continue;
        }

        if (is_option(arg, nullptr, "--no-enum-shorthand")) {
            opts.render_options.force_enum_shorthand = false;
            continue;
        }

        if (is_option(arg, nullptr, "--max-depth")) {
            opts.render_options.max_depth = parse_size("--max-depth", take_value(argc, argv, i));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-' && arg[1] != '\0') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose or --debug");
    }

    if (opts.input_files.size() > 1 && (opts.variable_name || opts.file_name)) {
        throw std::runtime_error("-n/--name and --file require a single input file");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input.yaml>...\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help                   Show this help message\n";
    std::cout << "  --version                    Show version information\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o, --output <dir>           Output directory (default: $SNAPFIX_ROOT or ./__Snapshots__)\n";
    std::cout << "  -n, --name <name>            Variable name (default: input file stem)\n";
    std::cout << "  -t, --type <type>            Declared type (default: inferred)\n";
    std::cout << "  --file <name>                Output file name (default: Type+name.swift)\n";
    std::cout << "  --no-overwrite               Fail if the output file exists\n";
    std::cout << "  --stdout                     Print the fixture instead of writing it\n";
    std::cout << "\n";

    std::cout << "Content:\n";
    std::cout << "  --header <text>              Header comment lines\n";
    std::cout << "  --context <text>             Doc comment above the declaration\n";
    std::cout << "\n";

    std::cout << "Formatting:\n";
    std::cout << "  --indent-style space|tab     Indentation character (default: space)\n";
    std::cout << "  --indent-width <n>           Spaces per level (default: 4)\n";
    std::cout << "  --crlf                       Use CRLF line endings\n";
    std::cout << "  --no-final-newline           Omit the final newline\n";
    std::cout << "  --keep-trailing-whitespace   Keep trailing whitespace\n";
    std::cout << "\n";

    std::cout << "Rendering:\n";
    std::cout << "  --no-sort-keys               Keep dictionary entries in input order\n";
    std::cout << "  --no-set-order               Keep set elements in input order\n";
    std::cout << "  --inline-threshold <n>       Largest Data rendered as a byte list (default: 16)\n";
    std::cout << "  --no-enum-shorthand          Always qualify enum cases with the type\n";
    std::cout << "  --max-depth <n>              Nesting limit (default: 256)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose                Verbose output\n";
    std::cout << "  --debug                      Debug output\n";
    std::cout << "  -q, --quiet                  Quiet mode (errors only)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " user.yaml\n";
    std::cout << "  " << program_name << " -n alice -t User -o Tests/Fixtures user.yaml\n";
    std::cout << "  " << program_name << " --stdout --no-enum-shorthand order.yaml\n";
}

void print_version() {
    std::cout << "snapfix v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace snapfix::driver
