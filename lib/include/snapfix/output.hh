//
// Output Collaborators
//
// Where fixture files go and how they are written. The snapshot runtime
// only talks to the PathResolver and FileWriter interfaces; the default
// implementations use std::filesystem.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace snapfix {

/// Output file descriptor
struct OutputFile {
    std::filesystem::path path;  // Full path: output_dir + filename
    std::string content;         // Formatted fixture source
};

/// Directory created next to the working directory when nothing else is configured
inline constexpr const char* kDefaultSnapshotDirectory = "__Snapshots__";

class PathResolver {
public:
    virtual ~PathResolver() = default;

    /**
     * Resolve the output directory.
     *
     * Priority: explicit_dir → global_root → env_root → `<cwd>/__Snapshots__`.
     */
    virtual std::filesystem::path resolve_directory(
        const std::optional<std::filesystem::path>& explicit_dir,
        const std::optional<std::filesystem::path>& global_root,
        const std::optional<std::filesystem::path>& env_root) const = 0;

    /**
     * Resolve the file path inside directory.
     *
     * `file_name` (with ".swift" appended when missing), or
     * `TypeName+variable.swift`.
     */
    virtual std::filesystem::path resolve_file(
        const std::string& type_name,
        const std::string& variable_name,
        const std::optional<std::string>& file_name,
        const std::filesystem::path& directory) const = 0;
};

class DefaultPathResolver : public PathResolver {
public:
    std::filesystem::path resolve_directory(
        const std::optional<std::filesystem::path>& explicit_dir,
        const std::optional<std::filesystem::path>& global_root,
        const std::optional<std::filesystem::path>& env_root) const override;

    /// Characters not allowed in file names on common filesystems become '_'
    std::filesystem::path resolve_file(
        const std::string& type_name,
        const std::string& variable_name,
        const std::optional<std::string>& file_name,
        const std::filesystem::path& directory) const override;
};

class FileWriter {
public:
    virtual ~FileWriter() = default;

    /**
     * Persist file.content at file.path.
     *
     * @throws overwrite_disallowed_error if the file exists and allow_overwrite is false
     * @throws io_error on any filesystem failure
     */
    virtual void write(const OutputFile& file, bool allow_overwrite) = 0;
};

/// Writes through std::filesystem, creating parent directories
class FilesystemWriter : public FileWriter {
public:
    void write(const OutputFile& file, bool allow_overwrite) override;
};

} // namespace snapfix
