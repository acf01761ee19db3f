#pragma once
// csimux: ProviderRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: lookups take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers (load/add) are serialized by a mutex, copy the whole map, and publish it
//     with one RELEASE swap, so a module's providers appear all at once or not at all.
//   • Readers never block writers; writers never block readers.
//   • Shared setup (bootstrap) runs exactly once per registry, guarded by std::call_once.
// Lifetime: loaded modules stay mapped until the registry is destroyed. Providers
// created from a module must be destroyed before the registry.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "csimux/error.hpp"
#include "csimux/obs/observability.hpp"
#include "csimux/os/dynlib.hpp"
#include "csimux/provider/module_abi.hpp"
#include "csimux/provider/service_provider.hpp"

namespace csimux::provider {

/// Zero-argument constructor producing a fresh provider instance.
using ProviderCtor = std::function<std::unique_ptr<ServiceProvider>()>;

/** @struct ProviderDescriptor
 *  @brief Immutable registry entry.
 */
struct ProviderDescriptor {
    std::string  name;    ///< Name as exported (original case)
    std::string  module;  ///< Module path, empty for linked-in providers
    ProviderCtor ctor;

    /// Construct a new provider instance.
    [[nodiscard]] std::unique_ptr<ServiceProvider> create() const { return ctor(); }
};

///
/// Maintains a mapping: lowercase provider name → ProviderDescriptor.
/// - Names are unique case-insensitively; registering an existing name fails.
/// - Entries are never replaced or removed.
///
class ProviderRegistry final {
public:
    using Map = std::unordered_map<std::string, std::shared_ptr<const ProviderDescriptor>>;
    using Bootstrap = std::function<void()>;

    /// Registry with the default bootstrap (protobuf runtime version check).
    explicit ProviderRegistry(obs::Observer* obs = nullptr);

    /// Registry with a custom one-time bootstrap action.
    explicit ProviderRegistry(Bootstrap bootstrap, obs::Observer* obs = nullptr);

    ~ProviderRegistry();

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    // --------------------------- Mutations -----------------------------------
    /// Run the shared setup once. Every load() calls this first.
    void bootstrap();

    /// Load one module and publish all of its providers atomically.
    Result<void> load(const std::string& path);

    /// Load modules in order; stops at the first failure (earlier modules stay loaded).
    Result<void> load(std::span<const std::string> paths);

    /// Register a linked-in provider.
    Result<void> add(std::string_view name, ProviderCtor ctor);

    // --------------------------- Reads ---------------------------------------
    /// Consistent snapshot of the whole map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Case-insensitive lookup. Fails with ErrorCode::ProviderNotFound.
    Result<std::shared_ptr<const ProviderDescriptor>> lookup(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const noexcept;
    /// Registered names (original case), sorted.
    [[nodiscard]] std::vector<std::string> list_names() const;
    /// Paths of the modules currently retained.
    [[nodiscard]] std::vector<std::string> modules() const;

    /// Monotonic version counter. Increments on every published mutation.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Observability -------------------------------
    struct Stats {
        std::uint64_t bootstraps{0}, loads{0}, load_failures{0}, adds{0}, add_failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    /// Validate `entries` against the current map, then publish them in one swap.
    Result<void> publish(const std::vector<ProviderDescriptor>& entries);

    static std::string fold(std::string_view name);

    Bootstrap                  bootstrap_;
    obs::Observer*             obs_;
    std::once_flag             boot_once_;

    mutable std::mutex         write_mu_;
    std::vector<os::DynLib>    modules_;   // declared before map_: unloaded after entries are dropped
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<std::uint64_t> version_{0};

    std::atomic<std::uint64_t> bootstraps_{0}, loads_{0}, load_failures_{0}, adds_{0}, add_failures_{0};
};

} // namespace csimux::provider
