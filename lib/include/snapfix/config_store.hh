//
// Configuration Store
//
// Process-level defaults consulted by every snapshot call. Each setting
// group has its own lock, held only while the value is copied.
//

#pragma once

#include <snapfix/render_options.hh>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace snapfix {

/// Copy of every setting, taken once at the start of a call
struct GlobalConfig {
    std::optional<std::filesystem::path> root;
    std::optional<std::string> header;
    FormatProfile format_profile;
    RenderOptions render_options;
};

class ConfigStore {
public:
    ConfigStore() = default;

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /// Output directory used when a call gives none; nullopt clears it
    void set_root(std::optional<std::filesystem::path> root);
    [[nodiscard]] std::optional<std::filesystem::path> root() const;

    /// Header emitted at the top of every fixture; nullopt clears it
    void set_header(std::optional<std::string> header);
    [[nodiscard]] std::optional<std::string> header() const;

    void set_format_profile(const FormatProfile& profile);
    [[nodiscard]] FormatProfile format_profile() const;

    void set_render_options(const RenderOptions& options);
    [[nodiscard]] RenderOptions render_options() const;

    /// Restore library defaults for every setting
    void reset_to_defaults();

    [[nodiscard]] GlobalConfig snapshot() const;

    static RenderOptions library_default_render_options() { return RenderOptions{}; }
    static FormatProfile library_default_format_profile() { return FormatProfile{}; }

private:
    mutable std::mutex output_mutex_;   // root, header
    mutable std::mutex format_mutex_;
    mutable std::mutex options_mutex_;

    std::optional<std::filesystem::path> root_;
    std::optional<std::string> header_;
    FormatProfile format_profile_;
    RenderOptions render_options_;
};

} // namespace snapfix
