//
// Type Descriptors
//
// Per-type metadata supplied ahead of time: member renames, redactions,
// ignored members and whole-value render overrides. The dispatcher consults
// a descriptor before falling back to structural reflection.
//

#pragma once

#include <snapfix/value.hh>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace snapfix {

/// Replace the value with a fixed string literal
struct MaskRedaction {
    std::string text = "•••";

    bool operator==(const MaskRedaction&) const = default;
};

/// Replace the value with the literal "<hashed>"
struct HashRedaction {
    bool operator==(const HashRedaction&) const = default;
};

using Redaction = std::variant<MaskRedaction, HashRedaction>;

/// Text emitted for a hashed member
inline constexpr const char* kHashedPlaceholder = "<hashed>";

struct PropertyDescriptor {
    std::string original_name;
    std::optional<std::string> renamed_label;
    std::optional<Redaction> redaction;
    bool ignored = false;

    static PropertyDescriptor plain(std::string name);
    static PropertyDescriptor renamed(std::string name, std::string label);
    static PropertyDescriptor masked(std::string name, std::string text = "•••");
    static PropertyDescriptor hashed(std::string name);
    static PropertyDescriptor ignored_property(std::string name);
};

struct TypeDescriptor {
    std::string type_name;
    std::vector<PropertyDescriptor> properties;

    /// Whole-value override; when set its output is used verbatim
    std::function<std::string(const Value&)> render_fn;

    [[nodiscard]] const PropertyDescriptor* find_property(const std::string& name) const;
};

using DescriptorMap = std::map<std::string, TypeDescriptor>;

/**
 * Thread-safe table of type descriptors keyed by type name.
 *
 * Writers copy the table and swap it in; render calls hold an immutable
 * snapshot for their whole duration.
 */
class DescriptorTable {
public:
    DescriptorTable();

    DescriptorTable(const DescriptorTable&) = delete;
    DescriptorTable& operator=(const DescriptorTable&) = delete;

    /// Register or replace the descriptor for descriptor.type_name
    void register_descriptor(TypeDescriptor descriptor);

    [[nodiscard]] std::optional<TypeDescriptor> lookup(const std::string& type_name) const;
    [[nodiscard]] bool has_descriptor(const std::string& type_name) const;
    bool unregister_descriptor(const std::string& type_name);

    [[nodiscard]] std::shared_ptr<const DescriptorMap> snapshot() const;

    /// Drop every descriptor
    void clear();

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const DescriptorMap> table_;
};

} // namespace snapfix
