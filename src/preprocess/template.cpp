// template.cpp - Template registry
// Part of rustimport - on-demand native extension builds

#include "preprocess/template.hpp"
#include "config/manifest.hpp"
#include "preprocess/pyo3_template.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rustimport {

config::Value Template::manifest_with_defaults(const config::Value& defaults) const {
    return config::merge_manifests(context_.manifest, defaults);
}

const std::map<std::string, TemplateFactory>& template_registry() {
    static const std::map<std::string, TemplateFactory> registry = {
        {"pyo3", [](TemplateContext context) -> std::unique_ptr<Template> {
            return std::make_unique<PyO3Template>(std::move(context));
        }},
    };
    return registry;
}

std::unique_ptr<Template> create_template(std::string_view name, TemplateContext context) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& registry = template_registry();
    auto it = registry.find(key);
    if (it == registry.end()) {
        std::string known;
        for (const auto& entry : registry) {
            if (!known.empty()) known += ", ";
            known += entry.first;
        }
        throw std::invalid_argument("Unknown template '" + std::string(name) +
                                    "' (available: " + known + ")");
    }
    return it->second(std::move(context));
}

} // namespace rustimport
