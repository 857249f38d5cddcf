#pragma once

#include <iostream>
#include <string>

namespace snapfix::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + file-by-file progress
    Debug    // + loader and renderer details
};

enum class ColorMode {
    Auto,    // termcolor decides per stream (TTY detection)
    Always,
    Never
};

/**
 * Console reporter for the exporter.
 *
 * Errors and warnings go to the error stream, everything else to the
 * output stream. Streams are injectable so tests can capture them.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// "  • message", shown from min_level up
    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    std::ostream& out_;
    std::ostream& err_;

    bool should_log(LogLevel required_level) const;
};

} // namespace snapfix::driver
