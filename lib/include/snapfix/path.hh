//
// Breadcrumb Path
//
// Location of the node being rendered, from the root value downwards.
//

#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace snapfix {

class PathSegment {
public:
    enum class Kind {
        Field,  ///< Named member of a record, object or enum payload
        Index,  ///< Position in a sequence, set or collection
        Key     ///< Map entry, identified by the rendered key expression
    };

    static PathSegment field(std::string name);
    static PathSegment index(std::size_t position);
    static PathSegment key(std::string rendered_key);

    [[nodiscard]] Kind kind() const;

    /// Field name or rendered key; empty for index segments
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] std::size_t position() const;

    /// `name`, `[3]` or `["key"]`
    [[nodiscard]] std::string to_string() const;

    bool operator==(const PathSegment& other) const = default;

private:
    Kind kind_ = Kind::Field;
    std::string text_;
    std::size_t position_ = 0;
};

using Path = std::vector<PathSegment>;

/// Join segments with " → "
std::string format_path(const Path& path);

} // namespace snapfix
