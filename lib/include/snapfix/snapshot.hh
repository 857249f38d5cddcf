//
// Snapshot Runtime
//
// Entry points turning a value into an expression, a formatted fixture
// source, or a fixture file on disk.
//
// Usage:
//   snapfix::Snapshotter snapshotter;   // bound to Environment::shared()
//
//   std::string expr = snapshotter.render(value);
//
//   snapfix::ExportRequest request;
//   request.variable_name = "alice";
//   request.context = "Default logged-in user";
//   auto path = snapshotter.export_fixture(value, request);
//

#pragma once

#include <snapfix/environment.hh>
#include <snapfix/output.hh>
#include <snapfix/value.hh>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace snapfix {

struct ExportRequest {
    std::string variable_name;
    std::optional<std::string> type_name;               ///< Inferred from the value when absent
    std::optional<std::string> file_name;
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::string> header;                  ///< Overrides the configured header
    std::optional<std::string> context;                 ///< Doc comment above the declaration
    bool allow_overwrite = true;
};

class Snapshotter {
public:
    explicit Snapshotter(Environment& environment = Environment::shared(),
                         std::shared_ptr<PathResolver> resolver = std::make_shared<DefaultPathResolver>(),
                         std::shared_ptr<FileWriter> writer = std::make_shared<FilesystemWriter>());

    /// Expression text for value, using the configured render options
    [[nodiscard]] std::string render(const Value& value) const;

    /// Formatted fixture source: header, import, extension with the static declaration
    [[nodiscard]] std::string generate_code(const Value& value, const ExportRequest& request) const;

    /// Fixture source plus the path it would be written to
    [[nodiscard]] OutputFile prepare_fixture(const Value& value, const ExportRequest& request) const;

    /// Generate and write the fixture file
    /// @return path of the written file
    std::filesystem::path export_fixture(const Value& value, const ExportRequest& request) const;

    /// Root taken from the process environment (lowest-priority directory override)
    void set_environment_root(std::optional<std::filesystem::path> root) { env_root_ = std::move(root); }
    [[nodiscard]] const std::optional<std::filesystem::path>& environment_root() const { return env_root_; }

    Environment& environment() const { return environment_; }

private:
    Environment& environment_;
    std::shared_ptr<PathResolver> resolver_;
    std::shared_ptr<FileWriter> writer_;
    std::optional<std::filesystem::path> env_root_;
};

/**
 * Turn an arbitrary name into a Swift identifier.
 *
 * Keywords are wrapped in backticks, characters other than letters, digits
 * and underscores become '_', a leading digit gets a '_' prefix, and an
 * empty or all-underscore result becomes "_".
 */
std::string sanitize_variable_name(const std::string& name);

/**
 * Swift type name for a value: "Int", "Array<Int>",
 * "Dictionary<String, Int>", "Set<String>", or the declared name of records,
 * enums and named collections. Heterogeneous elements give "Any".
 *
 * @throws unsupported_type_error for nil (the type cannot be inferred)
 */
std::string infer_type_name(const Value& value);

} // namespace snapfix
