// template.hpp - Templates for generated build configuration
// Part of rustimport - on-demand native extension builds
//
// A template is selected by the `// rustimport:<name>` sentinel. It supplies
// default Cargo.toml content for a binding style and may synthesize glue
// code the user left out.

#ifndef RUSTIMPORT_TEMPLATE_HPP
#define RUSTIMPORT_TEMPLATE_HPP

#include "config/value.hpp"
#include "core/settings.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

struct TemplateContext {
    fs::path source_path;
    std::string lib_name;
    std::string contents;
    config::Value manifest;   // fragment merged with the crate manifest
    TargetOs target_os = host_target_os();
};

struct TemplatingResult {
    config::Value manifest;
    std::optional<std::string> updated_source;  // nullopt: source untouched
    std::vector<std::string> extra_cargo_args;
};

class Template {
public:
    explicit Template(TemplateContext context) : context_(std::move(context)) {}
    virtual ~Template() = default;

    Template(const Template&) = delete;
    Template& operator=(const Template&) = delete;

    virtual TemplatingResult process() const = 0;

    const TemplateContext& context() const { return context_; }

protected:
    // The caller's manifest, with `defaults` filling in whatever it lacks.
    config::Value manifest_with_defaults(const config::Value& defaults) const;

    TemplateContext context_;
};

using TemplateFactory = std::function<std::unique_ptr<Template>(TemplateContext)>;

// Registered templates by lowercase name.
const std::map<std::string, TemplateFactory>& template_registry();

/**
 * Instantiate the template registered under `name` (case-insensitive).
 *
 * @throws std::invalid_argument for an unknown template name
 */
std::unique_ptr<Template> create_template(std::string_view name, TemplateContext context);

} // namespace rustimport

#endif // RUSTIMPORT_TEMPLATE_HPP
