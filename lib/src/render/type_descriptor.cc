#include <snapfix/type_descriptor.hh>

namespace snapfix {

// ============================================================================
// PropertyDescriptor
// ============================================================================

PropertyDescriptor PropertyDescriptor::plain(std::string name) {
    PropertyDescriptor property;
    property.original_name = std::move(name);
    return property;
}

PropertyDescriptor PropertyDescriptor::renamed(std::string name, std::string label) {
    PropertyDescriptor property = plain(std::move(name));
    property.renamed_label = std::move(label);
    return property;
}

PropertyDescriptor PropertyDescriptor::masked(std::string name, std::string text) {
    PropertyDescriptor property = plain(std::move(name));
    property.redaction = MaskRedaction{std::move(text)};
    return property;
}

PropertyDescriptor PropertyDescriptor::hashed(std::string name) {
    PropertyDescriptor property = plain(std::move(name));
    property.redaction = HashRedaction{};
    return property;
}

PropertyDescriptor PropertyDescriptor::ignored_property(std::string name) {
    PropertyDescriptor property = plain(std::move(name));
    property.ignored = true;
    return property;
}

const PropertyDescriptor* TypeDescriptor::find_property(const std::string& name) const {
    for (const auto& property : properties) {
        if (property.original_name == name) {
            return &property;
        }
    }
    return nullptr;
}

// ============================================================================
// DescriptorTable
// ============================================================================

DescriptorTable::DescriptorTable()
    : table_(std::make_shared<const DescriptorMap>())
{
}

void DescriptorTable::register_descriptor(TypeDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto updated = std::make_shared<DescriptorMap>(*table_);
    std::string key = descriptor.type_name;
    (*updated)[key] = std::move(descriptor);
    table_ = std::move(updated);
}

std::optional<TypeDescriptor> DescriptorTable::lookup(const std::string& type_name) const {
    auto table = snapshot();
    auto it = table->find(type_name);
    if (it == table->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DescriptorTable::has_descriptor(const std::string& type_name) const {
    auto table = snapshot();
    return table->find(type_name) != table->end();
}

bool DescriptorTable::unregister_descriptor(const std::string& type_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (table_->find(type_name) == table_->end()) {
        return false;
    }
    auto updated = std::make_shared<DescriptorMap>(*table_);
    updated->erase(type_name);
    table_ = std::move(updated);
    return true;
}

std::shared_ptr<const DescriptorMap> DescriptorTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

void DescriptorTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::make_shared<const DescriptorMap>();
}

} // namespace snapfix
