#include <snapfix/yaml/yaml_value_loader.hh>
#include <snapfix/canonical.hh>

#include <charconv>
#include <fstream>
#include <system_error>

namespace snapfix::yaml {

namespace {

    constexpr const char* kTypeKey = "$type";
    constexpr const char* kMembersKey = "$members";
    constexpr const char* kEnumKey = "$enum";
    constexpr const char* kCaseKey = "$case";
    constexpr const char* kRawKey = "$raw";

    /// Label used inside $members for a positional member
    constexpr const char* kPositionalLabel = "_";

    bool is_reserved_key(const std::string& key) {
        return !key.empty() && key[0] == '$';
    }

    std::string key_text(const fkyaml::node& key, const std::string& location) {
        if (!key.is_string()) {
            throw load_error("member names must be strings", location);
        }
        return key.get_value<std::string>();
    }

    std::string required_string(const fkyaml::node& node, const char* key, const std::string& location) {
        if (!node.contains(key) || !node[key].is_string()) {
            throw load_error(std::string("'") + key + "' must be a string", location);
        }
        return node[key].get_value<std::string>();
    }

    std::string scalar_text(const fkyaml::node& node, const std::string& tag, const std::string& location) {
        if (!node.is_string()) {
            throw load_error(tag + " expects quoted text", location);
        }
        return node.get_value<std::string>();
    }

} // anonymous namespace

Value YamlValueLoader::load_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw load_error("failed to open file: " + path);
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(file);
    } catch (const std::exception& e) {
        throw load_error(std::string("failed to parse YAML: ") + e.what(), path);
    }

    return from_node(root);
}

Value YamlValueLoader::load_string(const std::string& text) const {
    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(text);
    } catch (const std::exception& e) {
        throw load_error(std::string("failed to parse YAML: ") + e.what());
    }

    return from_node(root);
}

Value YamlValueLoader::from_node(const fkyaml::node& node) const {
    return convert(node, "$");
}

Value YamlValueLoader::convert(const fkyaml::node& node, const std::string& location) const {
    if (node.has_tag_name()) {
        const std::string& tag = node.get_tag_name();
        // Standard tags ("!!str", ...) only fix the scalar type fkYAML already resolved
        if (tag.rfind("!!", 0) != 0) {
            return convert_tagged(node, tag, location);
        }
    }

    if (node.is_null()) {
        return Value::nil();
    }
    if (node.is_boolean()) {
        return Value::boolean(node.get_value<bool>());
    }
    if (node.is_integer()) {
        return Value::integer(node.get_value<std::int64_t>());
    }
    if (node.is_float_number()) {
        return Value::floating(node.get_value<double>());
    }
    if (node.is_string()) {
        return Value::string(node.get_value<std::string>());
    }

    if (node.is_sequence()) {
        std::vector<Value> elements;
        std::size_t index = 0;
        for (const auto& item : node) {
            elements.push_back(convert(item, location + "[" + std::to_string(index++) + "]"));
        }
        return Value::sequence(std::move(elements));
    }

    if (node.is_mapping()) {
        if (node.contains(kTypeKey)) {
            return convert_record(node, location);
        }
        if (node.contains(kEnumKey)) {
            return convert_enum(node, location);
        }

        std::vector<std::pair<Value, Value>> entries;
        for (auto it = node.begin(); it != node.end(); ++it) {
            Value key = convert(it.key(), location + ".<key>");
            const std::string entry_location = it.key().is_string()
                ? location + "." + it.key().get_value<std::string>()
                : location + ".<entry>";
            entries.emplace_back(std::move(key), convert(*it, entry_location));
        }
        return Value::map(std::move(entries));
    }

    throw load_error("unsupported node type", location);
}

Value YamlValueLoader::convert_tagged(const fkyaml::node& node, const std::string& tag,
                                      const std::string& location) const {
    if (tag == "!date") {
        if (node.is_integer()) {
            return Value::date(static_cast<double>(node.get_value<std::int64_t>()));
        }
        if (node.is_float_number()) {
            return Value::date(node.get_value<double>());
        }
        if (node.is_string()) {
            const std::string text = node.get_value<std::string>();
            double seconds = 0.0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
            if (ec == std::errc() && end == text.data() + text.size()) {
                return Value::date(seconds);
            }
        }
        throw load_error("!date expects seconds since the epoch", location);
    }

    if (tag == "!uuid") {
        auto uuid = parse_uuid(scalar_text(node, tag, location));
        if (!uuid) {
            throw load_error("malformed UUID", location);
        }
        return Value::uuid(*uuid);
    }

    if (tag == "!url") {
        return Value::url(scalar_text(node, tag, location));
    }

    if (tag == "!decimal") {
        if (node.is_integer()) {
            return Value::decimal(std::to_string(node.get_value<std::int64_t>()));
        }
        std::string text = scalar_text(node, tag, location);
        if (!is_decimal_numeral(text)) {
            throw load_error("malformed decimal: " + text, location);
        }
        return Value::decimal(std::move(text));
    }

    if (tag == "!data") {
        auto bytes = base64_decode(scalar_text(node, tag, location));
        if (!bytes) {
            throw load_error("malformed base64 payload", location);
        }
        return Value::data(std::move(*bytes));
    }

    if (tag == "!char") {
        std::string text = scalar_text(node, tag, location);
        if (!is_single_grapheme(text)) {
            throw load_error("!char expects a single character", location);
        }
        return Value::character(std::move(text));
    }

    if (tag == "!set") {
        if (!node.is_sequence()) {
            throw load_error("!set expects a sequence", location);
        }
        std::vector<Value> elements;
        std::size_t index = 0;
        for (const auto& item : node) {
            elements.push_back(convert(item, location + "[" + std::to_string(index++) + "]"));
        }
        return Value::set(std::move(elements));
    }

    throw load_error("unknown tag " + tag, location);
}

Value YamlValueLoader::convert_record(const fkyaml::node& node, const std::string& location) const {
    std::string type_name = required_string(node, kTypeKey, location);
    return Value::record(std::move(type_name), convert_members(node, location));
}

Value YamlValueLoader::convert_enum(const fkyaml::node& node, const std::string& location) const {
    std::string type_name = required_string(node, kEnumKey, location);
    std::string case_name = required_string(node, kCaseKey, location);

    if (node.contains(kRawKey)) {
        Value raw = convert(node[kRawKey], location + "." + kRawKey);
        return Value::raw_enumeration(std::move(type_name), std::move(case_name), std::move(raw));
    }

    return Value::enumeration(std::move(type_name), std::move(case_name),
                              convert_members(node, location));
}

std::vector<Member> YamlValueLoader::convert_members(const fkyaml::node& node,
                                                     const std::string& location) const {
    std::vector<Member> members;

    if (node.contains(kMembersKey)) {
        const auto& list = node[kMembersKey];
        if (!list.is_sequence()) {
            throw load_error("'$members' must be a sequence", location);
        }

        std::size_t index = 0;
        for (const auto& entry : list) {
            const std::string entry_location = location + ".$members[" + std::to_string(index++) + "]";
            if (!entry.is_mapping() || entry.size() != 1) {
                throw load_error("'$members' entries must be single-entry mappings", entry_location);
            }

            auto it = entry.begin();
            std::string label = key_text(it.key(), entry_location);
            Value value = convert(*it, entry_location + "." + label);
            if (label == kPositionalLabel) {
                members.push_back(Member(std::move(value)));
            } else {
                members.push_back(Member(std::move(label), std::move(value)));
            }
        }
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string label = key_text(it.key(), location);
        if (is_reserved_key(label)) {
            continue;
        }
        if (node.contains(kMembersKey)) {
            throw load_error("member '" + label + "' given beside '$members'", location);
        }
        members.push_back(Member(label, convert(*it, location + "." + label)));
    }

    return members;
}

} // namespace snapfix::yaml
