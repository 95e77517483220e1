// scaffold.cpp - `rustimport new` project templates
// Part of rustimport - on-demand native extension builds

#include "core/scaffold.hpp"
#include "core/log.hpp"
#include "importable/crate_unit.hpp"
#include "importable/workspace.hpp"
#include "preprocess/pyo3_template.hpp"

#include <regex>
#include <stdexcept>

namespace rustimport {

namespace {

const char* const PLACEHOLDER = "{{EXTENSION_NAME}}";

const char* const LIB_TEMPLATE = R"(// rustimport:pyo3

use pyo3::prelude::*;

#[pyfunction]
fn say_hello() {
    println!("Hello from {{EXTENSION_NAME}}, implemented in Rust!")
}

// Uncomment the below to implement custom pyo3 binding code. Otherwise,
// rustimport will generate it for you for all functions annotated with
// #[pyfunction] and all structs annotated with #[pyclass].
//
//#[pymodule]
//fn {{EXTENSION_NAME}}(m: &Bound<'_, PyModule>) -> PyResult<()> {
//    m.add_function(wrap_pyfunction!(say_hello, m)?)?;
//    Ok(())
//}
)";

const char* const CARGO_TEMPLATE = R"([package]
name = "{{EXTENSION_NAME}}"
version = "0.1.0"
edition = "2021"


# ======================
#  pyo3 configuration:
# ======================

# You can safely remove the code below to let rustimport define your
# pyo3-configuration automatically. It's still possible to add other
# configuration or dependencies, or overwrite specific parts here.
# rustimport will merge your Cargo.toml file into its generated
# default configuration.
[lib]
# The name of the native library. This is the name the extension is
# imported by.
name = "{{EXTENSION_NAME}}"
#
# "cdylib" is necessary to produce a shared library.
crate-type = ["cdylib"]

[dependencies]
pyo3 = { version = "{{PYO3_VERSION}}", features = ["extension-module"] }
)";

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

bool is_valid_extension_name(const std::string& name) {
    static const std::regex pattern(R"(^[a-zA-Z]\w*(\.rs)?$)");
    return std::regex_match(name, pattern);
}

std::string render_lib_template(const std::string& extension_name) {
    return replace_all(LIB_TEMPLATE, PLACEHOLDER, extension_name);
}

std::string render_cargo_template(const std::string& extension_name) {
    std::string text = replace_all(CARGO_TEMPLATE, PLACEHOLDER, extension_name);
    return replace_all(text, "{{PYO3_VERSION}}", PyO3Template::PYO3_VERSION);
}

fs::path create_extension(const std::string& name, const fs::path& base_dir) {
    if (!is_valid_extension_name(name)) {
        throw std::invalid_argument(
            "Invalid extension name: " + name + ". The name may only contain letters (preferably "
            "lowercase), numbers and underscores and should start with a letter.");
    }

    fs::path path = base_dir / name;
    const std::string extension_name = fs::path(name).stem().string();

    if (fs::exists(path)) {
        throw std::runtime_error("Refusing to overwrite existing " + path.string());
    }

    if (path.extension() == ".rs") {
        write_if_changed(path, render_lib_template(extension_name));
    } else {
        fs::create_directories(path / "src");
        write_if_changed(path / "src" / "lib.rs", render_lib_template(extension_name));
        write_if_changed(path / "Cargo.toml", render_cargo_template(extension_name));
        write_if_changed(path / OPT_IN_MARKER,
                         "This is a marker-file to make this crate importable by rustimport.");
    }

    RUSTIMPORT_LOG_INFO("Created " << path.string());
    return path;
}

} // namespace rustimport
