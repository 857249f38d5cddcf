#include <snapfix/path.hh>

namespace snapfix {

PathSegment PathSegment::field(std::string name) {
    PathSegment segment;
    segment.kind_ = Kind::Field;
    segment.text_ = std::move(name);
    return segment;
}

PathSegment PathSegment::index(std::size_t position) {
    PathSegment segment;
    segment.kind_ = Kind::Index;
    segment.position_ = position;
    return segment;
}

PathSegment PathSegment::key(std::string rendered_key) {
    PathSegment segment;
    segment.kind_ = Kind::Key;
    segment.text_ = std::move(rendered_key);
    return segment;
}

PathSegment::Kind PathSegment::kind() const {
    return kind_;
}

const std::string& PathSegment::name() const {
    return text_;
}

std::size_t PathSegment::position() const {
    return position_;
}

std::string PathSegment::to_string() const {
    switch (kind_) {
        case Kind::Field:
            return text_;
        case Kind::Index:
            return "[" + std::to_string(position_) + "]";
        case Kind::Key:
            return "[" + text_ + "]";
    }
    return text_;
}

std::string format_path(const Path& path) {
    std::string result;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            result += " → ";
        }
        result += path[i].to_string();
    }
    return result;
}

} // namespace snapfix
