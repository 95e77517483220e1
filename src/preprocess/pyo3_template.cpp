// pyo3_template.cpp - Template for PyO3 extension modules
// Part of rustimport - on-demand native extension builds

#include "preprocess/pyo3_template.hpp"
#include "core/log.hpp"

#include <regex>
#include <sstream>

namespace rustimport {

namespace {

// Optional extra attributes, then modifiers such as `pub`, `pub(crate)`,
// `async` or `unsafe`, before the item keyword.
#define RUSTIMPORT_ITEM_PREFIX R"(\s*(?:#\[[^\]]*\]\s*)*(?:\w+(?:\([^)]*\))?\s+)*?)"

const std::regex& module_pattern() {
    static const std::regex pattern(
        R"(#\[pymodule(?:\([^)]*\))?\])" RUSTIMPORT_ITEM_PREFIX R"((?:fn|mod)\s+(\w+))");
    return pattern;
}

const std::regex& function_pattern() {
    static const std::regex pattern(
        R"(#\[pyfunction(?:\([^)]*\))?\])" RUSTIMPORT_ITEM_PREFIX R"(fn\s+(\w+))");
    return pattern;
}

const std::regex& class_pattern() {
    static const std::regex pattern(
        R"(#\[pyclass(?:\([^)]*\))?\])" RUSTIMPORT_ITEM_PREFIX R"((?:struct|enum)\s+(\w+))");
    return pattern;
}

#undef RUSTIMPORT_ITEM_PREFIX

bool is_ident_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

std::vector<std::string> collect_names(const std::string& masked, const std::regex& pattern) {
    std::vector<std::string> names;
    for (auto it = std::sregex_iterator(masked.begin(), masked.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        names.push_back((*it)[1].str());
    }
    return names;
}

} // namespace

std::string PyO3Template::mask_comments(std::string_view source) {
    std::string out(source);
    const size_t n = source.size();
    size_t i = 0;

    auto blank = [&](size_t pos) {
        if (out[pos] != '\n') out[pos] = ' ';
    };

    while (i < n) {
        char c = source[i];
        char next = (i + 1 < n) ? source[i + 1] : '\0';

        // Line comment
        if (c == '/' && next == '/') {
            while (i < n && source[i] != '\n') blank(i++);
            continue;
        }

        // Block comment (Rust allows nesting)
        if (c == '/' && next == '*') {
            int depth = 0;
            while (i < n) {
                if (source[i] == '/' && i + 1 < n && source[i + 1] == '*') {
                    depth++;
                    blank(i++);
                    blank(i++);
                } else if (source[i] == '*' && i + 1 < n && source[i + 1] == '/') {
                    depth--;
                    blank(i++);
                    blank(i++);
                    if (depth == 0) break;
                } else {
                    blank(i++);
                }
            }
            continue;
        }

        // Raw string: r"..." or r#"..."#, optionally with a b prefix
        bool raw_start = (c == 'r') && (next == '"' || next == '#') &&
                         (i == 0 || !is_ident_char(source[i - 1]) ||
                          (source[i - 1] == 'b' && (i < 2 || !is_ident_char(source[i - 2]))));
        if (raw_start) {
            size_t j = i + 1;
            size_t hashes = 0;
            while (j < n && source[j] == '#') {
                hashes++;
                j++;
            }
            if (j < n && source[j] == '"') {
                std::string terminator = "\"" + std::string(hashes, '#');
                size_t end = source.find(terminator, j + 1);
                i = (end == std::string_view::npos) ? n : end + terminator.size();
                continue;
            }
        }

        // String literal
        if (c == '"') {
            i++;
            while (i < n && source[i] != '"') {
                i += (source[i] == '\\') ? 2 : 1;
            }
            i++;
            continue;
        }

        // Char literal; a quote that does not close is a lifetime
        if (c == '\'') {
            if (next == '\\') {
                size_t j = i + 3;
                while (j < n && source[j] != '\'' && source[j] != '\n') j++;
                i = j + 1;
                continue;
            }
            if (i + 2 < n && source[i + 2] == '\'') {
                i += 3;
                continue;
            }
        }

        i++;
    }

    return out;
}

bool PyO3Template::has_module_registration(std::string_view source) {
    std::string masked = mask_comments(source);
    return std::regex_search(masked, module_pattern());
}

std::vector<std::string> PyO3Template::find_functions(std::string_view source) {
    return collect_names(mask_comments(source), function_pattern());
}

std::vector<std::string> PyO3Template::find_classes(std::string_view source) {
    return collect_names(mask_comments(source), class_pattern());
}

std::string PyO3Template::generate_module(const std::string& lib_name,
                                          const std::vector<std::string>& functions,
                                          const std::vector<std::string>& classes) {
    std::ostringstream oss;
    oss << "#[pymodule]\n";
    oss << "fn " << lib_name << "(m: &Bound<'_, PyModule>) -> PyResult<()> {\n";
    for (const auto& function : functions) {
        oss << "  m.add_function(wrap_pyfunction!(" << function << ", m)?)?;\n";
    }
    for (const auto& cls : classes) {
        oss << "  m.add_class::<" << cls << ">()?;\n";
    }
    oss << "  Ok(())\n";
    oss << "}\n";
    return oss.str();
}

std::vector<std::string> PyO3Template::cargo_args_for(TargetOs target_os) {
    if (target_os != TargetOs::MacOS) {
        return {};
    }
    // extension-module disables linking against libpython, so the macOS
    // linker must be told to resolve Python symbols at load time
    return {
        "--",
        "-C", "link-arg=-undefined",
        "-C", "link-arg=dynamic_lookup",
    };
}

config::Value PyO3Template::default_manifest() const {
    const std::string& lib = context_.lib_name;

    config::Value package = config::Value::table();
    package.set("name", lib);
    package.set("version", "0.1.0");
    package.set("edition", "2021");

    config::Value library = config::Value::table();
    library.set("name", lib);
    library.set("crate-type", config::Array{config::Value("cdylib")});

    config::Value pyo3 = config::Value::table();
    pyo3.set("version", PYO3_VERSION);
    pyo3.set("features", config::Array{config::Value("extension-module")});

    config::Value dependencies = config::Value::table();
    dependencies.set("pyo3", std::move(pyo3));

    config::Value defaults = config::Value::table();
    defaults.set("package", std::move(package));
    defaults.set("lib", std::move(library));
    defaults.set("dependencies", std::move(dependencies));
    return defaults;
}

TemplatingResult PyO3Template::process() const {
    TemplatingResult result;
    result.manifest = manifest_with_defaults(default_manifest());
    result.extra_cargo_args = cargo_args_for(context_.target_os);

    const std::string& contents = context_.contents;
    if (!has_module_registration(contents)) {
        std::vector<std::string> functions = find_functions(contents);
        std::vector<std::string> classes = find_classes(contents);

        RUSTIMPORT_LOG_DEBUG("Generating #[pymodule] for " << context_.source_path.string()
                             << " with " << functions.size() << " function(s) and "
                             << classes.size() << " class(es)");

        result.updated_source = contents + "\n\n" + generate_module(context_.lib_name, functions, classes);
    }

    return result;
}

} // namespace rustimport
