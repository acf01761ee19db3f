#pragma once
/**
 * @file module_abi.hpp
 * @brief C entry point exported by loadable provider modules.
 *
 * A module defines
 * @code
 *   extern "C" const csimux_provider_table* csimux_service_providers();
 * @endcode
 * returning a table with static storage duration. Modules link against the
 * shared csimux core, so provider objects may cross the boundary as C++ types.
 */

#include <cstddef>
#include <cstdint>

namespace csimux::provider { class ServiceProvider; }

extern "C" {

/// One provider exported by a module.
struct csimux_provider_entry {
    const char* name;                                  ///< Registry name (case-insensitive)
    csimux::provider::ServiceProvider* (*create)();    ///< Returns a new heap instance owned by the caller
};

/// Table returned by the module entry point.
struct csimux_provider_table {
    std::uint32_t                abi_version;  ///< Must equal PROVIDER_ABI_VERSION
    std::size_t                  count;
    const csimux_provider_entry* entries;
};

/// Signature of the module entry point.
typedef const csimux_provider_table* (*csimux_service_providers_fn)();

} // extern "C"
