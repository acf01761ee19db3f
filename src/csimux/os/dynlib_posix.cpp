/**
 * @file dynlib_posix.cpp
 * @brief POSIX dynamic library loader (Linux).
 */
#include "csimux/os/dynlib.hpp"

#include <dlfcn.h>
#include <utility>

namespace csimux::os {

static std::string last_dl_error() {
    const char* e = ::dlerror();
    return e ? std::string(e) : std::string("unknown dynamic loader error");
}

DynLib::~DynLib() { reset(); }

DynLib::DynLib(DynLib&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)), path_(std::move(other.path_)) {}

DynLib& DynLib::operator=(DynLib&& other) noexcept {
    if (this != &other) {
        reset();
        handle_ = std::exchange(other.handle_, nullptr);
        path_   = std::move(other.path_);
    }
    return *this;
}

void DynLib::reset() noexcept {
    if (handle_) {
        ::dlclose(handle_);
        handle_ = nullptr;
    }
}

Result<DynLib> DynLib::open(const std::string& path) {
    ::dlerror(); // clear stale state
    void* h = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        return make_error(ErrorCode::ModuleLoadFailed, path + ": " + last_dl_error());
    }
    return DynLib(h, path);
}

Result<void*> DynLib::symbol(const char* name) const {
    if (!handle_) return make_error(ErrorCode::ModuleLoadFailed, "library not loaded");
    ::dlerror();
    void* sym = ::dlsym(handle_, name);
    if (!sym) {
        return make_error(ErrorCode::ModuleSymbolMissing,
                          path_ + ": " + name + ": " + last_dl_error());
    }
    return sym;
}

} // namespace csimux::os
