// loader.hpp - Loading built extensions into the current process
// Part of rustimport - on-demand native extension builds

#ifndef RUSTIMPORT_LOADER_HPP
#define RUSTIMPORT_LOADER_HPP

#include "core/settings.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace rustimport {

namespace fs = std::filesystem;

/**
 * DynamicLibrary - RAII handle from dlopen()
 *
 * Opened with RTLD_NOW plus any extra flags (e.g. RTLD_GLOBAL so that
 * later extensions can resolve symbols from this one). Closed on
 * destruction.
 */
class DynamicLibrary {
public:
    /**
     * @throws std::runtime_error with the dlerror() text on failure
     */
    DynamicLibrary(const fs::path& path, int extra_flags = 0);
    ~DynamicLibrary();

    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    // nullptr if the symbol is not exported
    void* symbol(const std::string& name) const;

    // Throws std::runtime_error if the symbol is not exported.
    void* require_symbol(const std::string& name) const;

    template <typename Fn>
    Fn function(const std::string& name) const {
        return reinterpret_cast<Fn>(require_symbol(name));
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    void* handle_ = nullptr;
};

// Open the artifact with settings.rtld_flags.
std::unique_ptr<DynamicLibrary> load_extension(const fs::path& artifact_path,
                                               const Settings& settings);

} // namespace rustimport

#endif // RUSTIMPORT_LOADER_HPP
