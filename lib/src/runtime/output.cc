#include <snapfix/output.hh>
#include <snapfix/errors.hh>

#include <fstream>
#include <system_error>

namespace snapfix {

namespace {

    std::string file_safe(const std::string& name) {
        std::string result = name;
        for (char& c : result) {
            switch (c) {
                case '/': case '\\': case ':': case '*': case '?':
                case '"': case '<': case '>': case '|':
                    c = '_';
                    break;
                default:
                    break;
            }
        }
        return result;
    }

    bool ends_with(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

} // anonymous namespace

// ============================================================================
// DefaultPathResolver
// ============================================================================

std::filesystem::path DefaultPathResolver::resolve_directory(
    const std::optional<std::filesystem::path>& explicit_dir,
    const std::optional<std::filesystem::path>& global_root,
    const std::optional<std::filesystem::path>& env_root) const {
    if (explicit_dir) {
        return *explicit_dir;
    }
    if (global_root) {
        return *global_root;
    }
    if (env_root) {
        return *env_root;
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        throw io_error("cannot determine working directory: " + ec.message());
    }
    return cwd / kDefaultSnapshotDirectory;
}

std::filesystem::path DefaultPathResolver::resolve_file(
    const std::string& type_name,
    const std::string& variable_name,
    const std::optional<std::string>& file_name,
    const std::filesystem::path& directory) const {
    if (file_name && !file_name->empty()) {
        std::string name = *file_name;
        if (!ends_with(name, ".swift")) {
            name += ".swift";
        }
        return directory / name;
    }
    return directory / (file_safe(type_name) + "+" + file_safe(variable_name) + ".swift");
}

// ============================================================================
// FilesystemWriter
// ============================================================================

void FilesystemWriter::write(const OutputFile& file, bool allow_overwrite) {
    std::error_code ec;

    // Create parent directories if needed
    auto parent = file.path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw io_error("cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    if (!allow_overwrite && std::filesystem::exists(file.path, ec)) {
        throw overwrite_disallowed_error(file.path.string());
    }

    std::ofstream ofs(file.path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw io_error("failed to open file for writing: " + file.path.string());
    }

    ofs << file.content;

    if (!ofs) {
        throw io_error("failed to write file: " + file.path.string());
    }
}

} // namespace snapfix
