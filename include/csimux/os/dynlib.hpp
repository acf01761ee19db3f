#pragma once
/**
 * @file dynlib.hpp
 * @brief RAII handle for a dynamically loaded shared object (dlopen/dlsym).
 */

#include <string>

#include "csimux/error.hpp"

namespace csimux::os {

/** @class DynLib
 *  @brief Move-only owner of a dlopen handle. The library is unloaded on destruction.
 */
class DynLib final {
public:
    DynLib() noexcept = default;
    ~DynLib();

    DynLib(const DynLib&) = delete;
    DynLib& operator=(const DynLib&) = delete;
    DynLib(DynLib&& other) noexcept;
    DynLib& operator=(DynLib&& other) noexcept;

    /// dlopen(path, RTLD_NOW | RTLD_LOCAL). Fails with ErrorCode::ModuleLoadFailed.
    static Result<DynLib> open(const std::string& path);

    /// Resolve a symbol. Fails with ErrorCode::ModuleSymbolMissing.
    Result<void*> symbol(const char* name) const;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool loaded() const noexcept { return handle_ != nullptr; }

private:
    DynLib(void* handle, std::string path) noexcept : handle_(handle), path_(std::move(path)) {}
    void reset() noexcept;

    void*       handle_{nullptr};
    std::string path_;
};

} // namespace csimux::os
