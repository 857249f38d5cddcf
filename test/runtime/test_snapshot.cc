//
// Tests for the snapshot runtime: rendering, code generation, export
//

#include <doctest/doctest.h>
#include <snapfix/errors.hh>
#include <snapfix/snapshot.hh>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace snapfix;
namespace fs = std::filesystem;

namespace {

    /// Records writes instead of touching the filesystem
    class RecordingWriter : public FileWriter {
    public:
        void write(const OutputFile& file, bool allow_overwrite) override {
            files.push_back(file);
            overwrite_flags.push_back(allow_overwrite);
        }

        std::vector<OutputFile> files;
        std::vector<bool> overwrite_flags;
    };

    Value alice() {
        return Value::record("User", {Member("id", Value::integer(1)),
                                      Member("name", Value::string("Alice"))});
    }

    ExportRequest request_for(const std::string& name) {
        ExportRequest request;
        request.variable_name = name;
        return request;
    }

} // anonymous namespace

TEST_SUITE("Runtime - Snapshotter") {

    TEST_CASE("Render uses the configured options") {
        Environment env;
        Snapshotter snapshotter(env);
        auto role = Value::enumeration("Role", "admin");

        CHECK(snapshotter.render(role) == ".admin");

        RenderOptions options;
        options.force_enum_shorthand = false;
        env.config().set_render_options(options);
        CHECK(snapshotter.render(role) == "Role.admin");
    }

    TEST_CASE("Generated fixture source") {
        Environment env;
        env.config().set_header("Generated by tests");
        Snapshotter snapshotter(env);

        CHECK(snapshotter.generate_code(alice(), request_for("alice")) ==
              "// Generated by tests\n"
              "\n"
              "import Foundation\n"
              "\n"
              "extension User {\n"
              "    static let alice: User = User(id: 1, name: \"Alice\")\n"
              "}\n");
    }

    TEST_CASE("Request overrides header, type and adds context") {
        Environment env;
        env.config().set_header("Configured");
        Snapshotter snapshotter(env);

        ExportRequest request = request_for("numbers");
        request.header = "From request";
        request.type_name = "[Int]";
        request.context = "Small sample";

        auto numbers = Value::sequence({Value::integer(1), Value::integer(2)});
        CHECK(snapshotter.generate_code(numbers, request) ==
              "// From request\n"
              "\n"
              "import Foundation\n"
              "\n"
              "extension [Int] {\n"
              "    /// Small sample\n"
              "    static let numbers: [Int] = [\n"
              "        1,\n"
              "        2,\n"
              "    ]\n"
              "}\n");
    }

    TEST_CASE("Format profile is applied") {
        Environment env;
        FormatProfile profile;
        profile.indent_style = IndentStyle::Tab;
        profile.line_ending = LineEnding::CRLF;
        env.config().set_format_profile(profile);
        Snapshotter snapshotter(env);

        CHECK(snapshotter.generate_code(Value::integer(42), request_for("answer")) ==
              "import Foundation\r\n\r\nextension Int {\r\n\tstatic let answer: Int = 42\r\n}\r\n");
    }

    TEST_CASE("Render failures surface unchanged") {
        Environment env;
        Snapshotter snapshotter(env);
        auto order = Value::record("Order", {Member("total", Value::opaque("Money", 5))});

        CHECK_THROWS_AS(snapshotter.generate_code(order, request_for("order")), unsupported_type_error);
    }

    TEST_CASE("Export goes through the injected writer") {
        Environment env;
        auto writer = std::make_shared<RecordingWriter>();
        Snapshotter snapshotter(env, std::make_shared<DefaultPathResolver>(), writer);

        ExportRequest request = request_for("alice");
        request.output_dir = fs::path("/fixtures");
        request.allow_overwrite = false;

        const fs::path path = snapshotter.export_fixture(alice(), request);
        CHECK(path == fs::path("/fixtures") / "User+alice.swift");

        REQUIRE(writer->files.size() == 1);
        CHECK(writer->files[0].path == path);
        CHECK(writer->files[0].content == snapshotter.generate_code(alice(), request));
        CHECK(writer->overwrite_flags[0] == false);
    }

    TEST_CASE("Directory resolution order") {
        Environment env;
        auto writer = std::make_shared<RecordingWriter>();
        Snapshotter snapshotter(env, std::make_shared<DefaultPathResolver>(), writer);

        snapshotter.set_environment_root(fs::path("/env-root"));
        CHECK(snapshotter.prepare_fixture(alice(), request_for("alice")).path ==
              fs::path("/env-root") / "User+alice.swift");

        env.config().set_root(fs::path("/configured"));
        CHECK(snapshotter.prepare_fixture(alice(), request_for("alice")).path ==
              fs::path("/configured") / "User+alice.swift");

        ExportRequest request = request_for("alice");
        request.output_dir = fs::path("/explicit");
        request.file_name = "Users";
        CHECK(snapshotter.prepare_fixture(alice(), request).path == fs::path("/explicit") / "Users.swift");
    }

    TEST_CASE("Keyword variable names keep backticks only in source") {
        Environment env;
        Snapshotter snapshotter(env, std::make_shared<DefaultPathResolver>(),
                                std::make_shared<RecordingWriter>());

        ExportRequest request = request_for("default");
        request.output_dir = fs::path("/out");

        OutputFile file = snapshotter.prepare_fixture(alice(), request);
        CHECK(file.path == fs::path("/out") / "User+default.swift");
        CHECK(file.content.find("static let `default`: User") != std::string::npos);
    }

    TEST_CASE("Export writes a real file") {
        const fs::path dir = fs::temp_directory_path() / "snapfix_snapshot_export";
        fs::remove_all(dir);

        Environment env;
        Snapshotter snapshotter(env);
        ExportRequest request = request_for("alice");
        request.output_dir = dir;
        request.allow_overwrite = false;

        const fs::path path = snapshotter.export_fixture(alice(), request);
        std::ifstream in(path);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(content == snapshotter.generate_code(alice(), request));

        CHECK_THROWS_AS(snapshotter.export_fixture(alice(), request), overwrite_disallowed_error);
        fs::remove_all(dir);
    }
}

TEST_SUITE("Runtime - Naming") {

    TEST_CASE("Variable names") {
        CHECK(sanitize_variable_name("alice") == "alice");
        CHECK(sanitize_variable_name("class") == "`class`");
        CHECK(sanitize_variable_name("Self") == "`Self`");
        CHECK(sanitize_variable_name("my-user name") == "my_user_name");
        CHECK(sanitize_variable_name("2fast") == "_2fast");
        CHECK(sanitize_variable_name("") == "_");
        CHECK(sanitize_variable_name("---") == "_");
        CHECK(sanitize_variable_name("caf\xC3\xA9") == "caf\xC3\xA9");
    }

    TEST_CASE("Inferred type names") {
        CHECK(infer_type_name(Value::integer(1)) == "Int");
        CHECK(infer_type_name(Value::string("a")) == "String");
        CHECK(infer_type_name(alice()) == "User");
        CHECK(infer_type_name(Value::enumeration("Role", "admin")) == "Role");

        CHECK(infer_type_name(Value::sequence({Value::integer(1), Value::integer(2)})) == "Array<Int>");
        CHECK(infer_type_name(Value::sequence({Value::integer(1), Value::string("a")})) == "Array<Any>");
        CHECK(infer_type_name(Value::sequence({})) == "Array<Any>");
        CHECK(infer_type_name(Value::sequence({Value::integer(1), Value::nil()})) == "Array<Int?>");
        CHECK(infer_type_name(Value::sequence({Value::nil()})) == "Array<Any?>");
        CHECK(infer_type_name(Value::sequence({Value::sequence({Value::integer(1)})})) == "Array<Array<Int>>");

        CHECK(infer_type_name(Value::map({{Value::string("a"), Value::integer(1)}})) == "Dictionary<String, Int>");
        CHECK(infer_type_name(Value::map({})) == "Dictionary<AnyHashable, Any>");
        CHECK(infer_type_name(Value::set({})) == "Set<AnyHashable>");
        CHECK(infer_type_name(Value::set({Value::integer(1), Value::string("a")})) == "Set<AnyHashable>");
    }

    TEST_CASE("Nil has no inferable type") {
        CHECK_THROWS_AS(infer_type_name(Value::nil()), unsupported_type_error);
    }
}
