// manifest.cpp - Cargo manifest tree operations
// Part of rustimport - on-demand native extension builds

#include "config/manifest.hpp"
#include "core/log.hpp"

#include <string>

namespace rustimport::config {

namespace {

std::vector<std::string> split_path(std::string_view dotted) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = dotted.find('.', start);
        parts.emplace_back(dotted.substr(start, dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return parts;
}

template <typename NodePtr, typename Out>
void search(NodePtr node, const std::vector<std::string>& keys, size_t index, Out& out) {
    if (index == keys.size()) {
        out.push_back(node);
        return;
    }
    if (!node->is_table()) return;

    const std::string& key = keys[index];
    if (key == "*") {
        for (auto& member : node->as_table()) {
            search(&member.second, keys, index + 1, out);
        }
    } else if (auto* child = node->find(key)) {
        search(child, keys, index + 1, out);
    }
}

} // namespace

Value merge_manifests(const Value& override_value, const Value& defaults) {
    Value merged = override_value;
    if (!merged.is_table() || !defaults.is_table()) {
        return merged;
    }

    for (const auto& [key, default_value] : defaults.as_table()) {
        Value* existing = merged.find(key);
        if (!existing) {
            merged.set(key, default_value);
        } else if (existing->is_table() && default_value.is_table()) {
            *existing = merge_manifests(*existing, default_value);
        }
    }
    return merged;
}

std::vector<Value*> query(Value& root, std::string_view dotted_path) {
    std::vector<Value*> results;
    search(&root, split_path(dotted_path), 0, results);
    return results;
}

std::vector<const Value*> query(const Value& root, std::string_view dotted_path) {
    std::vector<const Value*> results;
    search(&root, split_path(dotted_path), 0, results);
    return results;
}

bool path_is_within(const fs::path& path, const fs::path& root) {
    fs::path relative = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (relative.empty()) return false;
    auto first = relative.begin();
    return *first != "..";
}

size_t rewrite_path_dependencies(Value& manifest, const fs::path& base_dir,
                                 const std::optional<fs::path>& keep_within) {
    size_t rewritten = 0;

    for (const char* section : DEPENDENCY_SECTIONS) {
        for (Value* dependencies : query(manifest, section)) {
            if (!dependencies->is_table()) continue;

            for (auto& [name, spec] : dependencies->as_table()) {
                const Value* path_value = spec.find("path");
                if (!path_value || !path_value->is_string()) continue;

                fs::path reference(path_value->as_string());
                fs::path resolved = reference.is_absolute()
                    ? reference.lexically_normal()
                    : (base_dir / reference).lexically_normal();

                if (keep_within && path_is_within(resolved, *keep_within)) {
                    continue;
                }

                RUSTIMPORT_LOG_DEBUG("Resolved path dependency '" << name << "' to " << resolved.string());
                spec.set("path", resolved.string());
                rewritten++;
            }
        }
    }

    return rewritten;
}

} // namespace rustimport::config
