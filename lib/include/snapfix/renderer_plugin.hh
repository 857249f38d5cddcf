//
// Renderer Plugin Interface
//
// Bundles of renderers installed into a RendererRegistry in one step.
// The default primitive and Foundation renderers ship as plugins.
//

#pragma once

#include <memory>
#include <string>

namespace snapfix {

// Forward declarations
class RendererRegistry;

// ============================================================================
// Renderer Plugin Interface
// ============================================================================

/**
 * Abstract interface for renderer plugins.
 *
 * Example usage:
 *
 * ```cpp
 * class MoneyRenderersPlugin : public RendererPlugin {
 * public:
 *     void register_renderers(RendererRegistry& registry) override {
 *         registry.register_renderer("Money", render_money);
 *     }
 *
 *     std::string get_name() const override { return "money"; }
 *     std::string get_version() const override { return "1.0.0"; }
 * };
 *
 * // Automatic registration into Environment::shared() via static initialization
 * REGISTER_RENDERER_PLUGIN(MoneyRenderersPlugin);
 * ```
 */
class RendererPlugin {
public:
    virtual ~RendererPlugin() = default;

    /**
     * Called on installation, and again whenever the owning environment
     * is reset.
     *
     * @param registry The renderer registry to register with
     */
    virtual void register_renderers(RendererRegistry& registry) = 0;

    virtual std::string get_name() const = 0;
    virtual std::string get_version() const = 0;
};

/// Bool, integer widths, Double, Float, String, Character
class PrimitiveRenderersPlugin : public RendererPlugin {
public:
    void register_renderers(RendererRegistry& registry) override;
    std::string get_name() const override { return "primitives"; }
    std::string get_version() const override { return "1.0.0"; }
};

/// Date, UUID, URL, Decimal, Data
class FoundationRenderersPlugin : public RendererPlugin {
public:
    void register_renderers(RendererRegistry& registry) override;
    std::string get_name() const override { return "foundation"; }
    std::string get_version() const override { return "1.0.0"; }
};

// ============================================================================
// Plugin Registration Helper
// ============================================================================

/**
 * Helper macro for automatic plugin registration via static initialization.
 *
 * Installs the plugin into Environment::shared(); the translation unit using
 * it must include <snapfix/environment.hh>.
 *
 * Usage:
 *   REGISTER_RENDERER_PLUGIN(MyRenderersPlugin);
 */
#define REGISTER_RENDERER_PLUGIN(PluginClass)                                  \
    namespace {                                                                 \
        struct PluginClass##_Registrar {                                        \
            PluginClass##_Registrar();                                          \
        };                                                                      \
        static PluginClass##_Registrar g_##PluginClass##_registrar;            \
        PluginClass##_Registrar::PluginClass##_Registrar() {                   \
            ::snapfix::Environment::shared().registry().register_plugin(        \
                std::make_unique<PluginClass>()                                 \
            );                                                                  \
        }                                                                       \
    }

} // namespace snapfix
