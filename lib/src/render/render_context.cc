#include <snapfix/render_context.hh>

#include <algorithm>

namespace snapfix {

RenderContext::RenderContext(RenderOptions options,
                             std::shared_ptr<const RendererTable> renderers,
                             std::shared_ptr<const DescriptorMap> descriptors)
    : options_(options)
    , renderers_(std::move(renderers))
    , descriptors_(std::move(descriptors))
{
}

std::optional<RenderFn> RenderContext::renderer_for(const std::string& type_key) const {
    if (!renderers_) {
        return std::nullopt;
    }
    auto it = renderers_->find(type_key);
    if (it == renderers_->end()) {
        return std::nullopt;
    }
    return it->second;
}

const TypeDescriptor* RenderContext::descriptor_for(const std::string& type_name) const {
    if (!descriptors_) {
        return nullptr;
    }
    auto it = descriptors_->find(type_name);
    return (it != descriptors_->end()) ? &it->second : nullptr;
}

RenderContext RenderContext::descend(PathSegment segment) const {
    RenderContext child = *this;
    child.path_.push_back(std::move(segment));
    return child;
}

RenderContext RenderContext::enter_object(const void* identity) const {
    RenderContext child = *this;
    child.ancestors_.push_back(identity);
    return child;
}

bool RenderContext::is_ancestor(const void* identity) const {
    return std::find(ancestors_.begin(), ancestors_.end(), identity) != ancestors_.end();
}

} // namespace snapfix
