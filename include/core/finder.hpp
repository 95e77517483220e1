// finder.hpp - Resolution of dotted module names to build units
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_FINDER_HPP
#define RUSTIMPORT_FINDER_HPP

#include "core/settings.hpp"
#include "importable/build_unit.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rustimport {

namespace fs = std::filesystem;

/**
 * Find the build unit for `fullname` (e.g. "pkg.fast_math").
 *
 * Dots map to directory separators; every search path is tried with every
 * variant from build_unit_factories(), in order. An empty `search_paths`
 * falls back to settings.search_paths, then to the current directory.
 *
 * @throws ImportNotFoundError listing the near misses when nothing matches
 */
std::unique_ptr<BuildUnit> find_build_unit(const std::string& fullname,
                                           const std::vector<fs::path>& search_paths,
                                           bool opt_in,
                                           const Settings& settings);

// Same, but returns nullptr and leaves the near misses in `reasons`.
std::unique_ptr<BuildUnit> try_find_build_unit(const std::string& fullname,
                                               const std::vector<fs::path>& search_paths,
                                               bool opt_in,
                                               const Settings& settings,
                                               FailureReasons& reasons);

// "a.b.c" -> "a/b/c"
fs::path module_relative_path(const std::string& fullname);

} // namespace rustimport

#endif // RUSTIMPORT_FINDER_HPP
