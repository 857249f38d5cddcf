#pragma once

#include <snapfix/value.hh>

#include <stdexcept>
#include <string>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace snapfix::yaml {

/**
 * Exception thrown when a document cannot be turned into a Value.
 */
class load_error : public std::runtime_error {
public:
    load_error(const std::string& message, const std::string& location = "")
        : std::runtime_error(format_error(message, location))
        , location_(location) {}

    [[nodiscard]] const std::string& location() const { return location_; }

private:
    std::string location_;

    static std::string format_error(const std::string& message, const std::string& location) {
        if (location.empty()) {
            return "YAML load error: " + message;
        }
        return "YAML load error at " + location + ": " + message;
    }
};

/**
 * Builds snapshot Values from YAML documents.
 *
 * Plain YAML maps onto the builtin kinds:
 *   null → nil, bool → Bool, integer → Int, float → Double,
 *   string → String, sequence → Array, mapping → Dictionary
 *
 * Local tags select Foundation kinds:
 *   !date 1700000000        seconds since the epoch
 *   !uuid "E621E1F8-..."    canonical UUID text
 *   !url, !decimal, !char   text payloads
 *   !data "SGVsbG8="        base64 bytes
 *   !set [1, 2, 3]          sequence rendered as a Set
 *
 * Mappings with reserved keys describe user types:
 *   { $type: User, name: Alice, age: 30 }
 *   { $type: User, $members: [ {name: Alice}, {age: 30} ] }
 *   { $enum: Role, $case: admin }
 *   { $enum: Status, $case: active, $raw: "active" }
 *   { $enum: Shape, $case: circle, radius: 2.0 }
 *
 * Example usage:
 *   YamlValueLoader loader;
 *   snapfix::Value value = loader.load_file("user.yaml");
 */
class YamlValueLoader {
public:
    /// @throws load_error if the file cannot be read or is malformed
    Value load_file(const std::string& path) const;

    /// @throws load_error if the document is malformed
    Value load_string(const std::string& text) const;

    /// Convert an already parsed node
    Value from_node(const fkyaml::node& node) const;

private:
    Value convert(const fkyaml::node& node, const std::string& location) const;
    Value convert_tagged(const fkyaml::node& node, const std::string& tag,
                         const std::string& location) const;
    Value convert_record(const fkyaml::node& node, const std::string& location) const;
    Value convert_enum(const fkyaml::node& node, const std::string& location) const;
    std::vector<Member> convert_members(const fkyaml::node& node, const std::string& location) const;
};

} // namespace snapfix::yaml
