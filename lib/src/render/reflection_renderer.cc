//
// Reflection Fallback Implementation
//

#include <snapfix/reflection_renderer.hh>
#include <snapfix/canonical.hh>
#include <snapfix/errors.hh>
#include <snapfix/value_renderer.hh>

#include "expression_layout.hh"

#include <algorithm>

namespace snapfix {

namespace {

    PathSegment member_segment(const Member& member, std::size_t position) {
        return member.label ? PathSegment::field(*member.label) : PathSegment::index(position);
    }

    std::string argument_label(const std::string& label, const RenderContext& ctx) {
        auto name = swift_name(label);
        if (!name) {
            throw reflection_error("invalid member label '" + label + "'", ctx.path());
        }
        return *name;
    }

    std::vector<std::string> render_arguments(const std::vector<Member>& members,
                                              const RenderContext& ctx) {
        std::vector<std::string> arguments;
        arguments.reserve(members.size());
        for (std::size_t i = 0; i < members.size(); ++i) {
            const Member& member = members[i];
            const RenderContext member_ctx = ctx.descend(member_segment(member, i));
            if (!member.label) {
                arguments.push_back(layout::argument(nullptr, render_value(member.value, member_ctx)));
                continue;
            }
            const std::string label = argument_label(*member.label, member_ctx);
            arguments.push_back(layout::argument(&label, render_value(member.value, member_ctx)));
        }
        return arguments;
    }

    std::string case_identifier(const std::string& case_name, const RenderContext& ctx) {
        auto name = swift_name(case_name);
        if (!name) {
            throw reflection_error("invalid enum case name '" + case_name + "'", ctx.path());
        }
        return *name;
    }

    std::string reflect_enum(const Value& value, const RenderContext& ctx) {
        const EnumData& data = value.as_enum();
        const bool shorthand = ctx.options().force_enum_shorthand;

        if (data.raw_value) {
            if (shorthand && is_plain_identifier(data.case_name)) {
                return "." + data.case_name;
            }
            std::string raw = render_value(*data.raw_value,
                                           ctx.descend(PathSegment::field("rawValue")));
            return data.type_name + "(rawValue: " + raw + ")!";
        }

        std::string head = (shorthand ? std::string(".") : data.type_name + ".") +
                           case_identifier(data.case_name, ctx);
        if (data.payload.empty()) {
            return head;
        }
        return layout::call(head, render_arguments(data.payload, ctx));
    }

    std::string redacted_text(const Redaction& redaction, const RenderContext& ctx) {
        if (const auto* mask = std::get_if<MaskRedaction>(&redaction)) {
            auto literal = quote_string_literal(mask->text);
            if (!literal) {
                throw reflection_error("mask text is not valid UTF-8", ctx.path());
            }
            return *literal;
        }
        return std::string("\"") + kHashedPlaceholder + "\"";
    }

    bool has_member(const std::vector<Member>& members, const std::string& name) {
        return std::any_of(members.begin(), members.end(), [&](const Member& member) {
            return member.label && *member.label == name;
        });
    }

} // anonymous namespace

std::string reflect_value(const Value& value, const RenderContext& ctx) {
    switch (value.kind()) {
        case Value::Kind::Record:
        case Value::Kind::Object:
            return layout::call(value.type_name(), render_arguments(value.members(), ctx));
        case Value::Kind::Enum:
            return reflect_enum(value, ctx);
        default:
            throw unsupported_type_error(value.type_key(), ctx.path());
    }
}

std::string render_with_descriptor(const Value& value,
                                   const TypeDescriptor& descriptor,
                                   const RenderContext& ctx) {
    if (descriptor.render_fn) {
        try {
            return descriptor.render_fn(value);
        } catch (const snapshot_error&) {
            throw;
        } catch (const std::exception& e) {
            throw reflection_error("descriptor renderer for '" + descriptor.type_name +
                                   "' failed: " + e.what(), ctx.path());
        }
    }

    const auto& members = value.members();
    for (const auto& property : descriptor.properties) {
        if (!has_member(members, property.original_name)) {
            throw reflection_error("property '" + property.original_name + "' not found on " +
                                   value.type_name(), ctx.path());
        }
    }

    std::vector<std::string> arguments;
    arguments.reserve(members.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
        const Member& member = members[i];
        const PropertyDescriptor* property =
            member.label ? descriptor.find_property(*member.label) : nullptr;

        if (property && property->ignored) {
            continue;
        }

        const RenderContext member_ctx = ctx.descend(member_segment(member, i));
        std::string expr = (property && property->redaction)
                               ? redacted_text(*property->redaction, member_ctx)
                               : render_value(member.value, member_ctx);

        if (property && property->renamed_label) {
            const std::string label = argument_label(*property->renamed_label, member_ctx);
            arguments.push_back(layout::argument(&label, expr));
        } else if (member.label) {
            const std::string label = argument_label(*member.label, member_ctx);
            arguments.push_back(layout::argument(&label, expr));
        } else {
            arguments.push_back(layout::argument(nullptr, expr));
        }
    }

    return layout::call(value.type_name(), arguments);
}

} // namespace snapfix
