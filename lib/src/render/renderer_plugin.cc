//
// Default Renderer Plugins
//

#include <snapfix/renderer_plugin.hh>
#include <snapfix/builtin_renderers.hh>
#include <snapfix/renderer_registry.hh>

namespace snapfix {

void PrimitiveRenderersPlugin::register_renderers(RendererRegistry& registry) {
    registry.register_renderer("Bool", builtin::render_bool);

    static constexpr IntegerWidth kWidths[] = {
        IntegerWidth::Int, IntegerWidth::Int8, IntegerWidth::Int16,
        IntegerWidth::Int32, IntegerWidth::Int64, IntegerWidth::UInt,
        IntegerWidth::UInt8, IntegerWidth::UInt16, IntegerWidth::UInt32,
        IntegerWidth::UInt64
    };
    for (IntegerWidth width : kWidths) {
        registry.register_renderer(integer_width_name(width), builtin::render_integer);
    }

    registry.register_renderer("Double", builtin::render_floating);
    registry.register_renderer("Float", builtin::render_floating);
    registry.register_renderer("String", builtin::render_string);
    registry.register_renderer("Character", builtin::render_character);
}

void FoundationRenderersPlugin::register_renderers(RendererRegistry& registry) {
    registry.register_renderer("Date", builtin::render_date);
    registry.register_renderer("UUID", builtin::render_uuid);
    registry.register_renderer("URL", builtin::render_url);
    registry.register_renderer("Decimal", builtin::render_decimal);
    registry.register_renderer("Data", builtin::render_data);
}

} // namespace snapfix
