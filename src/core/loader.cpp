// loader.cpp - Loading built extensions into the current process
// Part of rustimport - on-demand native extension builds

#include "core/loader.hpp"
#include "core/log.hpp"

#include <dlfcn.h>
#include <stdexcept>

namespace rustimport {

DynamicLibrary::DynamicLibrary(const fs::path& path, int extra_flags) : path_(path) {
    handle_ = ::dlopen(path_.c_str(), RTLD_NOW | extra_flags);
    if (!handle_) {
        const char* err = ::dlerror();
        throw std::runtime_error("Failed to load " + path_.string() + ": " +
                                 (err ? err : "unknown error"));
    }
    RUSTIMPORT_LOG_DEBUG("Loaded extension " << path_.string());
}

DynamicLibrary::~DynamicLibrary() {
    if (handle_) {
        ::dlclose(handle_);
        handle_ = nullptr;
    }
}

void* DynamicLibrary::symbol(const std::string& name) const {
    ::dlerror();  // clear
    void* sym = ::dlsym(handle_, name.c_str());
    if (::dlerror() != nullptr) {
        return nullptr;
    }
    return sym;
}

void* DynamicLibrary::require_symbol(const std::string& name) const {
    ::dlerror();  // clear
    void* sym = ::dlsym(handle_, name.c_str());
    const char* err = ::dlerror();
    if (err || !sym) {
        throw std::runtime_error("Symbol '" + name + "' not found in " + path_.string() +
                                 ": " + (err ? err : "null symbol"));
    }
    return sym;
}

std::unique_ptr<DynamicLibrary> load_extension(const fs::path& artifact_path,
                                               const Settings& settings) {
    return std::make_unique<DynamicLibrary>(artifact_path, settings.rtld_flags);
}

} // namespace rustimport
