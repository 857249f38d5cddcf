#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace snapfix::driver {

Logger::Logger(LogLevel level, ColorMode color, std::ostream& out, std::ostream& err)
    : level_(level)
    , out_(out)
    , err_(err)
{
    switch (color) {
        case ColorMode::Always:
            out_ << termcolor::colorize;
            err_ << termcolor::colorize;
            break;
        case ColorMode::Never:
            out_ << termcolor::nocolorize;
            err_ << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    err_ << termcolor::bold << termcolor::red << "error: " << termcolor::reset
         << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    err_ << termcolor::bold << termcolor::yellow << "warning: " << termcolor::reset
         << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out_ << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out_ << termcolor::bold << termcolor::green << "✓ " << termcolor::reset
         << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    out_ << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    out_ << termcolor::magenta << "[debug] " << termcolor::reset << message << "\n";
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!should_log(min_level)) return;

    out_ << "  • " << message << "\n";
}

} // namespace snapfix::driver
