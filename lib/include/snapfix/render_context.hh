//
// Render Context
//
// Immutable per-call state threaded through a render: breadcrumb path,
// active options, the registry and descriptor snapshots taken at entry, and
// the identities of the Object nodes currently being rendered.
//

#pragma once

#include <snapfix/path.hh>
#include <snapfix/render_options.hh>
#include <snapfix/type_descriptor.hh>
#include <snapfix/value.hh>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snapfix {

class RenderContext;

/// Custom renderer: produces the expression text for one value
using RenderFn = std::function<std::string(const Value&, const RenderContext&)>;

/// Type key → renderer
using RendererTable = std::map<std::string, RenderFn>;

class RenderContext {
public:
    /// Null snapshots behave as empty tables
    explicit RenderContext(RenderOptions options = {},
                           std::shared_ptr<const RendererTable> renderers = nullptr,
                           std::shared_ptr<const DescriptorMap> descriptors = nullptr);

    [[nodiscard]] const Path& path() const { return path_; }
    [[nodiscard]] std::size_t depth() const { return path_.size(); }
    [[nodiscard]] const RenderOptions& options() const { return options_; }

    [[nodiscard]] std::optional<RenderFn> renderer_for(const std::string& type_key) const;
    [[nodiscard]] const TypeDescriptor* descriptor_for(const std::string& type_name) const;

    /// Copy of this context with segment appended to the path
    [[nodiscard]] RenderContext descend(PathSegment segment) const;

    /// Copy of this context with identity recorded as an ancestor
    [[nodiscard]] RenderContext enter_object(const void* identity) const;
    [[nodiscard]] bool is_ancestor(const void* identity) const;

private:
    RenderOptions options_;
    std::shared_ptr<const RendererTable> renderers_;
    std::shared_ptr<const DescriptorMap> descriptors_;
    Path path_;
    std::vector<const void*> ancestors_;
};

} // namespace snapfix
