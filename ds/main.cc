#include <iostream>
#include <string>

#include "exporter.hh"
#include "exporter_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace snapfix::driver;

    try {
        // Parse command-line options (handles --help and --version automatically)
        ExporterOptions opts = parse_command_line(argc, argv);

        // Create logger based on verbosity options
        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;
        if (opts.debug) log_level = LogLevel::Debug;

        Logger logger(log_level, ColorMode::Auto);

        Exporter exporter(opts, logger, snapfix::Environment::shared());
        return exporter.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
