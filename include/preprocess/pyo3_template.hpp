// pyo3_template.hpp - Template for PyO3 extension modules
// Part of rustimport - on-demand native extension builds
//
// Supplies a cdylib Cargo.toml with the pyo3 dependency and, when the source
// has no `#[pymodule]`, appends one registering every `#[pyfunction]` and
// `#[pyclass]` it finds.
//
// The scan is a tolerant pattern match over the source with comments
// blanked out, not a Rust parser. Known blind spots: attributes spanning
// several lines, nested brackets inside attribute arguments, and items
// produced by macros. Anything it cannot recognize is left out of the
// generated module rather than guessed.

#ifndef RUSTIMPORT_PYO3_TEMPLATE_HPP
#define RUSTIMPORT_PYO3_TEMPLATE_HPP

#include "preprocess/template.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rustimport {

class PyO3Template : public Template {
public:
    static constexpr const char* PYO3_VERSION = "0.23";

    explicit PyO3Template(TemplateContext context) : Template(std::move(context)) {}

    TemplatingResult process() const override;

    // =========================================================================
    // Source scanning (public for testing)
    // =========================================================================

    // Replace comment text with spaces, keeping line breaks and string
    // literals, so commented-out attributes are not picked up.
    static std::string mask_comments(std::string_view source);

    // True if the source already declares a #[pymodule] fn or mod.
    static bool has_module_registration(std::string_view source);

    // Names of #[pyfunction] functions, in source order.
    static std::vector<std::string> find_functions(std::string_view source);

    // Names of #[pyclass] structs and enums, in source order.
    static std::vector<std::string> find_classes(std::string_view source);

    static std::string generate_module(const std::string& lib_name,
                                       const std::vector<std::string>& functions,
                                       const std::vector<std::string>& classes);

    static std::vector<std::string> cargo_args_for(TargetOs target_os);

private:
    config::Value default_manifest() const;
};

} // namespace rustimport

#endif // RUSTIMPORT_PYO3_TEMPLATE_HPP
