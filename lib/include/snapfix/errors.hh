//
// Snapshot error taxonomy
//
// Every failure of the rendering engine and the export pipeline is reported
// as a snapshot_error subclass. Errors are raised once, at the failure point,
// carrying the full breadcrumb; they are never rewrapped on the way up.
//

#pragma once

#include <snapfix/path.hh>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace snapfix {

enum class error_kind {
    UnsupportedType,
    IOFailure,
    OverwriteDisallowed,
    ReflectionFailure,
    FormattingFailure,
    CycleDetected,
    DepthLimitExceeded
};

const char* error_kind_name(error_kind kind);

/// "<head> at path: a → b", or just head for an empty path
std::string message_at_path(const std::string& head, const Path& path);

class snapshot_error : public std::runtime_error {
public:
    snapshot_error(error_kind kind, const std::string& msg, Path path = {})
        : std::runtime_error(msg), kind_(kind), path_(std::move(path)) {}

    [[nodiscard]] error_kind kind() const { return kind_; }

    /// Breadcrumb at the failure point (empty for I/O and formatting failures)
    [[nodiscard]] const Path& path() const { return path_; }

private:
    error_kind kind_;
    Path path_;
};

/// No renderer, built-in handler or reflection route applies to the value
class unsupported_type_error : public snapshot_error {
public:
    unsupported_type_error(const std::string& type_name, Path path)
        : snapshot_error(error_kind::UnsupportedType,
                         message_at_path("Unsupported type: " + type_name, path), path),
          type_name_(type_name) {}

    [[nodiscard]] const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class io_error : public snapshot_error {
public:
    explicit io_error(const std::string& reason)
        : snapshot_error(error_kind::IOFailure, "I/O error: " + reason),
          reason_(reason) {}

    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

class overwrite_disallowed_error : public snapshot_error {
public:
    explicit overwrite_disallowed_error(const std::string& file_path)
        : snapshot_error(error_kind::OverwriteDisallowed,
                         "File already exists and overwrite is disallowed: " + file_path),
          file_path_(file_path) {}

    [[nodiscard]] const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
};

class reflection_error : public snapshot_error {
public:
    reflection_error(const std::string& reason, Path path)
        : snapshot_error(error_kind::ReflectionFailure,
                         message_at_path("Reflection failed: " + reason, path),
                         path),
          reason_(reason) {}

    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

class formatting_error : public snapshot_error {
public:
    explicit formatting_error(const std::string& reason)
        : snapshot_error(error_kind::FormattingFailure, "Formatting failed: " + reason),
          reason_(reason) {}

    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

/// An Object node was reached again through its own members
class cycle_error : public snapshot_error {
public:
    cycle_error(const std::string& type_name, Path path)
        : snapshot_error(error_kind::CycleDetected,
                         message_at_path(
                             "Cycle detected in object graph: " + type_name, path),
                         path),
          type_name_(type_name) {}

    [[nodiscard]] const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class depth_limit_error : public snapshot_error {
public:
    depth_limit_error(std::size_t limit, Path path)
        : snapshot_error(error_kind::DepthLimitExceeded,
                         message_at_path(
                             "Maximum render depth " + std::to_string(limit) + " exceeded", path),
                         path),
          limit_(limit) {}

    [[nodiscard]] std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
};

} // namespace snapfix
