#include "exporter.hh"
#include <snapfix/errors.hh>
#include <cstdlib>
#include <iostream>

namespace snapfix::driver {

/// Environment variable naming the lowest-priority output root
static constexpr const char* kRootVariable = "SNAPFIX_ROOT";

Exporter::Exporter(const ExporterOptions& options, Logger& logger, Environment& environment)
    : options_(options)
    , logger_(logger)
    , environment_(environment)
{
}

int Exporter::run() {
    try {
        Snapshotter snapshotter(environment_);
        configure(snapshotter);

        for (const auto& input_file : options_.input_files) {
            export_file(snapshotter, input_file);
        }

        if (!options_.to_stdout) {
            logger_.success("Exported " + std::to_string(options_.input_files.size()) + " fixture(s)");
        }
        return 0;

    } catch (const yaml::load_error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const overwrite_disallowed_error& e) {
        logger_.error(std::string(e.what()) + " (drop --no-overwrite to replace it)");
        return 1;
    } catch (const snapshot_error& e) {
        logger_.error(std::string(error_kind_name(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

void Exporter::configure(Snapshotter& snapshotter) {
    auto& config = environment_.config();
    config.set_format_profile(options_.format_profile);
    config.set_render_options(options_.render_options);

    if (const char* root = std::getenv(kRootVariable); root && *root) {
        logger_.verbose(std::string(kRootVariable) + "=" + root);
        snapshotter.set_environment_root(std::filesystem::path(root));
    }
}

ExportRequest Exporter::make_request(const std::filesystem::path& input_file) const {
    ExportRequest request;
    request.variable_name = options_.variable_name ? *options_.variable_name
                                                   : input_file.stem().string();
    request.type_name = options_.type_name;
    request.file_name = options_.file_name;
    request.output_dir = options_.output_dir;
    request.header = options_.header;
    request.context = options_.context;
    request.allow_overwrite = options_.allow_overwrite;
    return request;
}

void Exporter::export_file(const Snapshotter& snapshotter, const std::filesystem::path& input_file) {
    logger_.verbose("Loading: " + input_file.string());
    Value value = loader_.load_file(input_file.string());
    logger_.debug(std::string("Loaded ") + kind_name(value.kind()) + " value");

    ExportRequest request = make_request(input_file);

    if (options_.to_stdout) {
        std::cout << snapshotter.generate_code(value, request);
        return;
    }

    auto path = snapshotter.export_fixture(value, request);
    logger_.bullet(input_file.string() + " → " + path.string());
}

}  // namespace snapfix::driver
