//
// Environment
//
// The service bundle a snapshot call runs against: renderer registry,
// descriptor table and configuration store. Tests create their own
// environments; Environment::shared() is the process-wide default.
//

#pragma once

#include <snapfix/config_store.hh>
#include <snapfix/render_context.hh>
#include <snapfix/renderer_registry.hh>
#include <snapfix/type_descriptor.hh>

namespace snapfix {

class Environment {
public:
    /// Installs the primitive and Foundation renderer plugins
    Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    static Environment& shared();

    RendererRegistry& registry() { return registry_; }
    const RendererRegistry& registry() const { return registry_; }

    DescriptorTable& descriptors() { return descriptors_; }
    const DescriptorTable& descriptors() const { return descriptors_; }

    ConfigStore& config() { return config_; }
    const ConfigStore& config() const { return config_; }

    /// Context for one render: current options, registry and descriptor snapshots
    [[nodiscard]] RenderContext make_context() const;
    [[nodiscard]] RenderContext make_context(const RenderOptions& options) const;

    /**
     * Back to the state after construction: ad-hoc renderers and
     * descriptors are dropped, installed plugins are replayed, and the
     * configuration returns to library defaults.
     */
    void reset();

private:
    RendererRegistry registry_;
    DescriptorTable descriptors_;
    ConfigStore config_;
};

} // namespace snapfix
