// preprocessor.cpp - Turns a Rust source plus header into a buildable crate
// Part of rustimport - on-demand native extension builds

#include "preprocess/preprocessor.hpp"
#include "config/manifest.hpp"
#include "config/toml_parser.hpp"
#include "config/toml_writer.hpp"
#include "core/log.hpp"
#include "preprocess/header.hpp"
#include "preprocess/template.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rustimport {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

Preprocessor::Preprocessor(fs::path source_path,
                           std::string lib_name,
                           std::optional<fs::path> manifest_path,
                           std::optional<fs::path> workspace_root,
                           TargetOs target_os)
    : source_path_(std::move(source_path)),
      lib_name_(std::move(lib_name)),
      manifest_path_(std::move(manifest_path)),
      workspace_root_(std::move(workspace_root)),
      target_os_(target_os) {}

PreprocessorResult Preprocessor::process() const {
    std::string contents = read_file(source_path_);
    HeaderConfig header = parse_header(contents);

    const fs::path source_dir = source_path_.parent_path();

    // Cargo resolves manifest paths against the manifest's directory, which
    // for a crate is the crate root rather than src/
    const fs::path manifest_dir = manifest_path_ ? manifest_path_->parent_path() : source_dir;

    config::Value manifest = config::parse_toml(header.manifest_fragment,
                                                source_path_.string() + " (header)");
    config::rewrite_path_dependencies(manifest, manifest_dir, workspace_root_);

    if (manifest_path_) {
        config::Value external = config::parse_toml_file(*manifest_path_);
        config::rewrite_path_dependencies(external, manifest_dir, workspace_root_);
        manifest = config::merge_manifests(external, manifest);
    }

    PreprocessorResult result;

    if (header.template_name) {
        RUSTIMPORT_LOG_DEBUG("Applying template '" << *header.template_name << "' to "
                             << source_path_.string());

        TemplateContext context;
        context.source_path = source_path_;
        context.lib_name = lib_name_;
        context.contents = contents;
        context.manifest = std::move(manifest);
        context.target_os = target_os_;

        auto tmpl = create_template(*header.template_name, std::move(context));
        TemplatingResult templated = tmpl->process();

        manifest = std::move(templated.manifest);
        result.updated_source = std::move(templated.updated_source);
        result.extra_cargo_args = std::move(templated.extra_cargo_args);
    }

    result.dependency_patterns = resolve_dependency_globs(header, source_dir);

    result.cargo_manifest = config::to_toml(manifest);
    result.manifest = std::move(manifest);
    return result;
}

} // namespace rustimport
