// single_file_unit.hpp - Build unit for a lone .rs file
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_SINGLE_FILE_UNIT_HPP
#define RUSTIMPORT_SINGLE_FILE_UNIT_HPP

#include "importable/build_unit.hpp"

namespace rustimport {

/**
 * A single source file. At build time a crate is synthesized around it:
 *
 *   <scratch>/<stem>/Cargo.toml    from the header (and template)
 *   <scratch>/<stem>/src/lib.rs    the source, possibly with generated glue
 */
class SingleFileUnit : public BuildUnit {
public:
    using BuildUnit::BuildUnit;

    // Appends ".rs" to `path` when missing.
    static std::unique_ptr<BuildUnit> try_create(const fs::path& path,
                                                 const std::string& fullname,
                                                 bool opt_in,
                                                 const Settings& settings,
                                                 FailureReasons& reasons);

    // The source itself plus its `//d:` globs
    std::vector<std::string> dependencies() const override;

    StagedCrate stage() const override;

    const char* kind() const override { return "single-file"; }

private:
    std::string crate_name() const;
};

} // namespace rustimport

#endif // RUSTIMPORT_SINGLE_FILE_UNIT_HPP
