//
// Snapshot Runtime Implementation
//

#include <snapfix/snapshot.hh>
#include <snapfix/canonical.hh>
#include <snapfix/codegen/code_formatter.hh>
#include <snapfix/codegen/fixture_writer.hh>
#include <snapfix/errors.hh>
#include <snapfix/value_renderer.hh>

#include <algorithm>
#include <set>
#include <vector>

namespace snapfix {

namespace {

    std::string element_type_name(const std::vector<Value>& values, const char* fallback) {
        std::set<std::string> names;
        bool has_nil = false;
        for (const auto& value : values) {
            if (value.is_nil()) {
                has_nil = true;
            } else {
                names.insert(infer_type_name(value));
            }
        }

        std::string name = names.size() == 1 ? *names.begin() : fallback;
        if (has_nil) {
            name += "?";
        }
        return name;
    }

    std::string strip_backticks(const std::string& name) {
        if (name.size() >= 2 && name.front() == '`' && name.back() == '`') {
            return name.substr(1, name.size() - 2);
        }
        return name;
    }

} // anonymous namespace

// ============================================================================
// Snapshotter
// ============================================================================

Snapshotter::Snapshotter(Environment& environment,
                         std::shared_ptr<PathResolver> resolver,
                         std::shared_ptr<FileWriter> writer)
    : environment_(environment)
    , resolver_(std::move(resolver))
    , writer_(std::move(writer))
{
}

std::string Snapshotter::render(const Value& value) const {
    return render_value(value, environment_.make_context());
}

std::string Snapshotter::generate_code(const Value& value, const ExportRequest& request) const {
    const GlobalConfig config = environment_.config().snapshot();

    codegen::FixtureSource source;
    source.type_name = request.type_name ? *request.type_name : infer_type_name(value);
    source.variable_name = sanitize_variable_name(request.variable_name);
    source.expression = render_value(value, environment_.make_context(config.render_options));
    source.header = request.header ? request.header : config.header;
    source.context = request.context;

    return codegen::CodeFormatter::format(codegen::build_fixture_source(source),
                                          config.format_profile);
}

OutputFile Snapshotter::prepare_fixture(const Value& value, const ExportRequest& request) const {
    OutputFile file;
    file.content = generate_code(value, request);

    const std::string type_name = request.type_name ? *request.type_name : infer_type_name(value);
    const auto directory = resolver_->resolve_directory(request.output_dir,
                                                        environment_.config().root(),
                                                        env_root_);
    file.path = resolver_->resolve_file(type_name,
                                        strip_backticks(sanitize_variable_name(request.variable_name)),
                                        request.file_name,
                                        directory);
    return file;
}

std::filesystem::path Snapshotter::export_fixture(const Value& value,
                                                  const ExportRequest& request) const {
    OutputFile file = prepare_fixture(value, request);
    writer_->write(file, request.allow_overwrite);
    return file.path;
}

// ============================================================================
// Naming
// ============================================================================

std::string sanitize_variable_name(const std::string& name) {
    if (is_swift_keyword(name)) {
        return "`" + name + "`";
    }

    std::string result;
    std::size_t pos = 0;
    while (pos < name.size()) {
        const char c = name[pos];
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_') {
            result += c;
            ++pos;
            continue;
        }

        // Non-ASCII scalars are kept as letters; anything else becomes '_'
        const std::size_t start = pos;
        auto scalar = decode_utf8_scalar(name, pos);
        if (scalar && *scalar >= 0x80) {
            result += name.substr(start, pos - start);
        } else {
            result += '_';
            if (!scalar) {
                pos = start + 1;
            }
        }
    }

    if (std::all_of(result.begin(), result.end(), [](char c) { return c == '_'; })) {
        return "_";
    }
    if (result[0] >= '0' && result[0] <= '9') {
        result = "_" + result;
    }
    return result;
}

std::string infer_type_name(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Nil:
            throw unsupported_type_error("Optional (type name required for nil)", {});
        case Value::Kind::Sequence:
            return "Array<" + element_type_name(value.elements(), "Any") + ">";
        case Value::Kind::Set:
            return "Set<" + element_type_name(value.elements(), "AnyHashable") + ">";
        case Value::Kind::Map: {
            std::vector<Value> keys;
            std::vector<Value> values;
            for (const auto& [key, mapped] : value.entries()) {
                keys.push_back(key);
                values.push_back(mapped);
            }
            return "Dictionary<" + element_type_name(keys, "AnyHashable") + ", " +
                   element_type_name(values, "Any") + ">";
        }
        default:
            return value.type_key();
    }
}

} // namespace snapfix
