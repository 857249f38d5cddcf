#include <snapfix/config_store.hh>

namespace snapfix {

void ConfigStore::set_root(std::optional<std::filesystem::path> root) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    root_ = std::move(root);
}

std::optional<std::filesystem::path> ConfigStore::root() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return root_;
}

void ConfigStore::set_header(std::optional<std::string> header) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    header_ = std::move(header);
}

std::optional<std::string> ConfigStore::header() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return header_;
}

void ConfigStore::set_format_profile(const FormatProfile& profile) {
    std::lock_guard<std::mutex> lock(format_mutex_);
    format_profile_ = profile;
}

FormatProfile ConfigStore::format_profile() const {
    std::lock_guard<std::mutex> lock(format_mutex_);
    return format_profile_;
}

void ConfigStore::set_render_options(const RenderOptions& options) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    render_options_ = options;
}

RenderOptions ConfigStore::render_options() const {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return render_options_;
}

void ConfigStore::reset_to_defaults() {
    std::scoped_lock lock(output_mutex_, format_mutex_, options_mutex_);
    root_.reset();
    header_.reset();
    format_profile_ = library_default_format_profile();
    render_options_ = library_default_render_options();
}

GlobalConfig ConfigStore::snapshot() const {
    std::scoped_lock lock(output_mutex_, format_mutex_, options_mutex_);
    return GlobalConfig{root_, header_, format_profile_, render_options_};
}

} // namespace snapfix
