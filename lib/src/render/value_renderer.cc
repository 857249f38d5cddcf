//
// Value Renderer Implementation
//

#include <snapfix/value_renderer.hh>
#include <snapfix/builtin_renderers.hh>
#include <snapfix/errors.hh>
#include <snapfix/reflection_renderer.hh>

#include "expression_layout.hh"

#include <algorithm>
#include <utility>

namespace snapfix {

namespace {

    // Registered renderers may throw anything; only snapshot errors pass through as-is
    std::string invoke_custom(const RenderFn& render_fn, const Value& value,
                              const RenderContext& ctx) {
        try {
            return render_fn(value, ctx);
        } catch (const snapshot_error&) {
            throw;
        } catch (const std::exception& e) {
            throw reflection_error("renderer for '" + value.type_key() + "' failed: " + e.what(),
                                   ctx.path());
        }
    }

    std::vector<std::string> render_elements(const std::vector<Value>& elements,
                                             const RenderContext& ctx) {
        std::vector<std::string> rendered;
        rendered.reserve(elements.size());
        for (std::size_t i = 0; i < elements.size(); ++i) {
            rendered.push_back(render_value(elements[i], ctx.descend(PathSegment::index(i))));
        }
        return rendered;
    }

    // ========================================================================
    // Collections
    // ========================================================================

    std::string render_sequence(const Value& value, const RenderContext& ctx) {
        return layout::list("[", render_elements(value.elements(), ctx), "]");
    }

    std::string render_set(const Value& value, const RenderContext& ctx) {
        auto rendered = render_elements(value.elements(), ctx);
        if (ctx.options().deterministic_set_order) {
            std::stable_sort(rendered.begin(), rendered.end());
        }
        return "Set(" + layout::list("[", rendered, "]") + ")";
    }

    std::string render_collection(const Value& value, const RenderContext& ctx) {
        return value.type_name() + "(" +
               layout::list("[", render_elements(value.elements(), ctx), "]") + ")";
    }

    std::string render_map(const Value& value, const RenderContext& ctx) {
        const auto& entries = value.entries();
        if (entries.empty()) {
            return "[:]";
        }

        std::vector<std::pair<std::string, std::string>> rendered;
        rendered.reserve(entries.size());
        for (const auto& [key, mapped] : entries) {
            std::string key_text = render_value(key, ctx);
            std::string value_text = render_value(mapped, ctx.descend(PathSegment::key(key_text)));
            rendered.emplace_back(std::move(key_text), std::move(value_text));
        }

        if (ctx.options().sort_map_keys) {
            std::stable_sort(rendered.begin(), rendered.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
        }

        std::vector<std::string> items;
        items.reserve(rendered.size());
        for (const auto& [key_text, value_text] : rendered) {
            items.push_back(key_text + ": " + value_text);
        }
        return layout::list("[", items, "]");
    }

    std::string render_node(const Value& value, const RenderContext& ctx) {
        if (value.is_nil()) {
            return "nil";
        }

        if (auto render_fn = ctx.renderer_for(value.type_key())) {
            return invoke_custom(*render_fn, value, ctx);
        }

        if (value.kind() == Value::Kind::Record || value.kind() == Value::Kind::Object) {
            if (const TypeDescriptor* descriptor = ctx.descriptor_for(value.type_name())) {
                return render_with_descriptor(value, *descriptor, ctx);
            }
        }

        if (auto text = builtin::render_builtin(value, ctx)) {
            return *text;
        }

        switch (value.kind()) {
            case Value::Kind::Sequence:
                return render_sequence(value, ctx);
            case Value::Kind::Map:
                return render_map(value, ctx);
            case Value::Kind::Set:
                return render_set(value, ctx);
            case Value::Kind::Collection:
                return render_collection(value, ctx);
            case Value::Kind::Record:
            case Value::Kind::Enum:
            case Value::Kind::Object:
                return reflect_value(value, ctx);
            default:
                throw unsupported_type_error(value.type_key(), ctx.path());
        }
    }

} // anonymous namespace

std::string render_value(const Value& value, const RenderContext& ctx) {
    if (ctx.depth() > ctx.options().max_depth) {
        throw depth_limit_error(ctx.options().max_depth, ctx.path());
    }

    if (value.kind() == Value::Kind::Object) {
        const void* identity = value.as_object().get();
        if (ctx.is_ancestor(identity)) {
            throw cycle_error(value.type_name(), ctx.path());
        }
        return render_node(value, ctx.enter_object(identity));
    }

    return render_node(value, ctx);
}

} // namespace snapfix
