#include <snapfix/errors.hh>

namespace snapfix {

std::string message_at_path(const std::string& head, const Path& path) {
    if (path.empty()) {
        return head;
    }
    return head + " at path: " + format_path(path);
}

const char* error_kind_name(error_kind kind) {
    switch (kind) {
        case error_kind::UnsupportedType:     return "unsupported type";
        case error_kind::IOFailure:           return "I/O failure";
        case error_kind::OverwriteDisallowed: return "overwrite disallowed";
        case error_kind::ReflectionFailure:   return "reflection failure";
        case error_kind::FormattingFailure:   return "formatting failure";
        case error_kind::CycleDetected:       return "cycle detected";
        case error_kind::DepthLimitExceeded:  return "depth limit exceeded";
    }
    return "unknown";
}

} // namespace snapfix
