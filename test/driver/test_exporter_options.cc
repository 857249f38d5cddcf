//
// Tests for command-line parsing
//

#include <doctest/doctest.h>
#include "exporter_options.hh"

#include <stdexcept>
#include <string>
#include <vector>

using namespace snapfix;
using namespace snapfix::driver;

namespace {

    ExporterOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "snapfix");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_command_line(static_cast<int>(argv.size()), argv.data());
    }

} // anonymous namespace

TEST_SUITE("Driver - Options") {

    TEST_CASE("Defaults") {
        auto opts = parse({"user.yaml"});
        REQUIRE(opts.input_files.size() == 1);
        CHECK(opts.input_files[0] == "user.yaml");
        CHECK_FALSE(opts.output_dir.has_value());
        CHECK(opts.allow_overwrite);
        CHECK_FALSE(opts.to_stdout);
        CHECK(opts.format_profile == FormatProfile{});
        CHECK(opts.render_options == RenderOptions{});
    }

    TEST_CASE("Output and content options") {
        auto opts = parse({"-o", "Fixtures", "-n", "alice", "-t", "User", "--file", "Users",
                           "--header", "Generated", "--context", "Admin user",
                           "--no-overwrite", "--stdout", "user.yaml"});
        CHECK(*opts.output_dir == "Fixtures");
        CHECK(*opts.variable_name == "alice");
        CHECK(*opts.type_name == "User");
        CHECK(*opts.file_name == "Users");
        CHECK(*opts.header == "Generated");
        CHECK(*opts.context == "Admin user");
        CHECK_FALSE(opts.allow_overwrite);
        CHECK(opts.to_stdout);
    }

    TEST_CASE("Formatting and rendering options") {
        auto opts = parse({"--indent-style", "tab", "--indent-width", "2", "--crlf",
                           "--no-final-newline", "--keep-trailing-whitespace",
                           "--no-sort-keys", "--no-set-order", "--inline-threshold", "32",
                           "--no-enum-shorthand", "--max-depth", "10", "a.yaml", "b.yaml"});
        CHECK(opts.format_profile.indent_style == IndentStyle::Tab);
        CHECK(opts.format_profile.indent_width == 2);
        CHECK(opts.format_profile.line_ending == LineEnding::CRLF);
        CHECK_FALSE(opts.format_profile.insert_final_newline);
        CHECK_FALSE(opts.format_profile.trim_trailing_whitespace);
        CHECK_FALSE(opts.render_options.sort_map_keys);
        CHECK_FALSE(opts.render_options.deterministic_set_order);
        CHECK(opts.render_options.inline_binary_threshold == 32);
        CHECK_FALSE(opts.render_options.force_enum_shorthand);
        CHECK(opts.render_options.max_depth == 10);
        CHECK(opts.input_files.size() == 2);
    }

    TEST_CASE("Verbosity") {
        CHECK(parse({"-v", "a.yaml"}).verbose);
        CHECK(parse({"--quiet", "a.yaml"}).quiet);
        CHECK(parse({"--debug", "a.yaml"}).debug);
        CHECK_THROWS_AS(parse({"-q", "-v", "a.yaml"}), std::runtime_error);
    }

    TEST_CASE("Invalid command lines") {
        CHECK_THROWS_AS(parse({}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--bogus", "a.yaml"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"a.yaml", "-o"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--indent-style", "wide", "a.yaml"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--indent-width", "-1", "a.yaml"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--max-depth", "ten", "a.yaml"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"-n", "x", "a.yaml", "b.yaml"}), std::runtime_error);
    }
}
