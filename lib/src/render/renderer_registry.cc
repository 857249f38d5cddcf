//
// Renderer Registry Implementation
//
// Copy-on-write table of type key → renderer.
//

#include <snapfix/renderer_registry.hh>
#include <snapfix/renderer_plugin.hh>

namespace snapfix {

    RendererRegistry::RendererRegistry()
        : table_(std::make_shared<const RendererTable>()) {
    }

    RendererRegistry::~RendererRegistry() = default;

    // ============================================================================
    // Renderer Registration & Lookup
    // ============================================================================

    void RendererRegistry::register_renderer(const std::string& type_key, RenderFn render_fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto updated = std::make_shared<RendererTable>(*table_);
        (*updated)[type_key] = std::move(render_fn);
        table_ = std::move(updated);
    }

    std::optional<RenderFn> RendererRegistry::lookup(const std::string& type_key) const {
        auto table = snapshot();
        auto it = table->find(type_key);
        if (it == table->end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool RendererRegistry::has_renderer(const std::string& type_key) const {
        auto table = snapshot();
        return table->find(type_key) != table->end();
    }

    bool RendererRegistry::unregister_renderer(const std::string& type_key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (table_->find(type_key) == table_->end()) {
            return false;
        }
        auto updated = std::make_shared<RendererTable>(*table_);
        updated->erase(type_key);
        table_ = std::move(updated);
        return true;
    }

    std::vector<std::string> RendererRegistry::registered_types() const {
        auto table = snapshot();
        std::vector<std::string> types;
        types.reserve(table->size());

        // std::map iteration is already sorted
        for (const auto& [type_key, _] : *table) {
            types.push_back(type_key);
        }

        return types;
    }

    std::shared_ptr<const RendererTable> RendererRegistry::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return table_;
    }

    void RendererRegistry::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        table_ = std::make_shared<const RendererTable>();
    }

    // ============================================================================
    // Plugins
    // ============================================================================

    void RendererRegistry::register_plugin(std::unique_ptr<RendererPlugin> plugin) {
        if (plugin) {
            plugin->register_renderers(*this);

            std::lock_guard<std::mutex> lock(plugins_mutex_);
            plugins_.push_back(std::move(plugin));
        }
    }

    void RendererRegistry::reinstall_plugins() {
        std::lock_guard<std::mutex> lock(plugins_mutex_);
        for (const auto& plugin : plugins_) {
            plugin->register_renderers(*this);
        }
    }

    std::vector<std::string> RendererRegistry::installed_plugins() const {
        std::lock_guard<std::mutex> lock(plugins_mutex_);
        std::vector<std::string> names;
        names.reserve(plugins_.size());
        for (const auto& plugin : plugins_) {
            names.push_back(plugin->get_name());
        }
        return names;
    }

} // namespace snapfix
