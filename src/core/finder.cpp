// finder.cpp - Resolution of dotted module names to build units
// Part of rustimport - on-demand native extension builds

#include "core/finder.hpp"
#include "core/log.hpp"

namespace rustimport {

fs::path module_relative_path(const std::string& fullname) {
    fs::path relative;
    size_t start = 0;
    while (start <= fullname.size()) {
        size_t dot = fullname.find('.', start);
        relative /= fullname.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return relative;
}

std::unique_ptr<BuildUnit> try_find_build_unit(const std::string& fullname,
                                               const std::vector<fs::path>& search_paths,
                                               bool opt_in,
                                               const Settings& settings,
                                               FailureReasons& reasons) {
    std::vector<fs::path> roots = search_paths;
    if (roots.empty()) roots = settings.search_paths;
    if (roots.empty()) roots.push_back(fs::current_path());

    const fs::path relative = module_relative_path(fullname);

    for (const auto& root : roots) {
        fs::path candidate = root / relative;
        RUSTIMPORT_LOG_DEBUG("Looking for " << fullname << " at " << candidate.string());
        if (auto unit = create_build_unit(candidate, fullname, opt_in, settings, reasons)) {
            return unit;
        }
    }
    return nullptr;
}

std::unique_ptr<BuildUnit> find_build_unit(const std::string& fullname,
                                           const std::vector<fs::path>& search_paths,
                                           bool opt_in,
                                           const Settings& settings) {
    FailureReasons reasons;
    auto unit = try_find_build_unit(fullname, search_paths, opt_in, settings, reasons);
    if (!unit) {
        throw ImportNotFoundError(fullname, opt_in, reasons.all());
    }
    return unit;
}

} // namespace rustimport
