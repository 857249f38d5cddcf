//
// Tests for the configuration store and the environment bundle
//

#include <doctest/doctest.h>
#include <snapfix/config_store.hh>
#include <snapfix/environment.hh>

using namespace snapfix;

TEST_SUITE("Runtime - Config store") {

    TEST_CASE("Library defaults") {
        ConfigStore store;
        CHECK_FALSE(store.root().has_value());
        CHECK_FALSE(store.header().has_value());

        const RenderOptions options = store.render_options();
        CHECK(options.sort_map_keys);
        CHECK(options.deterministic_set_order);
        CHECK(options.inline_binary_threshold == 16);
        CHECK(options.force_enum_shorthand);
        CHECK(options.max_depth == 256);

        const FormatProfile profile = store.format_profile();
        CHECK(profile.indent_style == IndentStyle::Space);
        CHECK(profile.indent_width == 4);
        CHECK(profile.line_ending == LineEnding::LF);
        CHECK(profile.insert_final_newline);
        CHECK(profile.trim_trailing_whitespace);
        CHECK(profile.indent_unit() == "    ");
    }

    TEST_CASE("Settings round-trip and reset") {
        ConfigStore store;
        store.set_root(std::filesystem::path("/tmp/fixtures"));
        store.set_header("Generated");

        RenderOptions options;
        options.max_depth = 8;
        store.set_render_options(options);

        FormatProfile profile;
        profile.indent_style = IndentStyle::Tab;
        store.set_format_profile(profile);

        const GlobalConfig config = store.snapshot();
        CHECK(*config.root == std::filesystem::path("/tmp/fixtures"));
        CHECK(*config.header == "Generated");
        CHECK(config.render_options.max_depth == 8);
        CHECK(config.format_profile.indent_unit() == "\t");

        store.set_header(std::nullopt);
        CHECK_FALSE(store.header().has_value());

        store.reset_to_defaults();
        CHECK_FALSE(store.root().has_value());
        CHECK(store.render_options() == ConfigStore::library_default_render_options());
        CHECK(store.format_profile() == ConfigStore::library_default_format_profile());
    }
}

TEST_SUITE("Runtime - Environment") {

    TEST_CASE("Reset restores the constructed state") {
        Environment env;
        env.registry().register_renderer("Money", [](const Value&, const RenderContext&) {
            return std::string("Money.zero");
        });
        TypeDescriptor descriptor;
        descriptor.type_name = "User";
        env.descriptors().register_descriptor(descriptor);
        env.config().set_header("Generated");

        env.reset();

        CHECK_FALSE(env.registry().has_renderer("Money"));
        CHECK(env.registry().has_renderer("String"));
        CHECK_FALSE(env.descriptors().has_descriptor("User"));
        CHECK_FALSE(env.config().header().has_value());
    }

    TEST_CASE("Contexts use the configured options unless given explicitly") {
        Environment env;
        RenderOptions options;
        options.max_depth = 3;
        env.config().set_render_options(options);

        CHECK(env.make_context().options().max_depth == 3);

        RenderOptions other;
        CHECK(env.make_context(other).options().max_depth == 256);
    }

    TEST_CASE("Shared environment is a singleton") {
        CHECK(&Environment::shared() == &Environment::shared());
    }
}
