#pragma once

#include <snapfix/render_context.hh>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace snapfix {

// Forward declaration
class RendererPlugin;

// ============================================================================
// Renderer Registry
// ============================================================================

/**
 * Registry of custom value renderers keyed by type key.
 *
 * The registry is consulted by the value renderer before any built-in
 * handling, so an entry for "Date" or "String" replaces the default output
 * for that type. The default primitive and Foundation renderers are
 * ordinary entries installed by plugins (see renderer_plugin.hh).
 *
 * **Usage Example:**
 * \code
 *   auto& registry = Environment::shared().registry();
 *
 *   registry.register_renderer("Money", [](const Value& v, const RenderContext&) {
 *       return "Money(cents: " + std::to_string(*v.opaque_as<long>()) + ")";
 *   });
 *
 *   if (registry.has_renderer("Money")) {
 *       // Money values now render through the lambda
 *   }
 * \endcode
 *
 * **Thread Safety:** Writers copy the table and swap it in under a mutex.
 * Lookups and snapshots see either the state before or after a concurrent
 * registration, never a partial one. A render holds the snapshot taken at
 * its entry for its whole duration.
 */
class RendererRegistry {
public:
    RendererRegistry();
    ~RendererRegistry();

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry(RendererRegistry&&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;
    RendererRegistry& operator=(RendererRegistry&&) = delete;

    // ========================================================================
    // Renderer Registration & Lookup
    // ========================================================================

    /**
     * Register a renderer for a type key.
     *
     * @param type_key Type key as reported by Value::type_key() (case-sensitive)
     * @param render_fn Renderer producing the expression text
     *
     * @note If a renderer is already registered, it is replaced (last wins)
     */
    void register_renderer(const std::string& type_key, RenderFn render_fn);

    /**
     * Look up a renderer by type key.
     *
     * @return Copy of the renderer, or nullopt if none is registered
     */
    std::optional<RenderFn> lookup(const std::string& type_key) const;

    bool has_renderer(const std::string& type_key) const;

    /**
     * Remove a renderer.
     *
     * @return true if a renderer was registered for type_key
     */
    bool unregister_renderer(const std::string& type_key);

    /// Registered type keys, sorted
    std::vector<std::string> registered_types() const;

    /// Immutable view of the current table, shared with render calls
    std::shared_ptr<const RendererTable> snapshot() const;

    /// Drop every registration (plugins stay installed)
    void clear();

    // ========================================================================
    // Plugins
    // ========================================================================

    /**
     * Install a renderer plugin.
     *
     * The plugin's register_renderers() method is called immediately, and
     * the plugin is kept so that reinstall_plugins() can replay it.
     */
    void register_plugin(std::unique_ptr<RendererPlugin> plugin);

    /// Re-run every installed plugin against the current table
    void reinstall_plugins();

    /// Names of installed plugins, in installation order
    std::vector<std::string> installed_plugins() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RendererTable> table_;

    /// Registered plugins (for lifetime management and replay on reset)
    std::vector<std::unique_ptr<RendererPlugin>> plugins_;
    mutable std::mutex plugins_mutex_;
};

} // namespace snapfix
