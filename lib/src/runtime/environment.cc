#include <snapfix/environment.hh>
#include <snapfix/renderer_plugin.hh>

namespace snapfix {

Environment::Environment() {
    registry_.register_plugin(std::make_unique<PrimitiveRenderersPlugin>());
    registry_.register_plugin(std::make_unique<FoundationRenderersPlugin>());
}

Environment& Environment::shared() {
    static Environment environment;
    return environment;
}

RenderContext Environment::make_context() const {
    return make_context(config_.render_options());
}

RenderContext Environment::make_context(const RenderOptions& options) const {
    return RenderContext(options, registry_.snapshot(), descriptors_.snapshot());
}

void Environment::reset() {
    registry_.clear();
    registry_.reinstall_plugins();
    descriptors_.clear();
    config_.reset_to_defaults();
}

} // namespace snapfix
