#pragma once

#include "exporter_options.hh"
#include "logger.hh"
#include <snapfix/snapshot.hh>
#include <snapfix/yaml/yaml_value_loader.hh>

namespace snapfix::driver {

/// Main exporter driver
class Exporter {
public:
    Exporter(const ExporterOptions& options, Logger& logger, Environment& environment);

    /// Export every input file
    /// Returns 0 on success, non-zero on error
    int run();

private:
    /// Install CLI formatting/rendering options and the SNAPFIX_ROOT root
    void configure(Snapshotter& snapshotter);

    /// Build the request for one input document
    ExportRequest make_request(const std::filesystem::path& input_file) const;

    /// Load, render and write (or print) one fixture
    void export_file(const Snapshotter& snapshotter, const std::filesystem::path& input_file);

    const ExporterOptions& options_;
    Logger& logger_;
    Environment& environment_;
    yaml::YamlValueLoader loader_;
};

}  // namespace snapfix::driver
