// ProviderRegistry: RCU Implementation Notes
// Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
// Writers: under write_mu_, copy current map, insert, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "csimux/provider/provider_registry.hpp"
#include "csimux/config/constants.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include <google/protobuf/stubs/common.h>

namespace csimux::provider {

using csimux::config::constants::PROVIDER_ABI_VERSION;
using csimux::config::constants::PROVIDER_TABLE_SYMBOL;

static void default_bootstrap() {
    GOOGLE_PROTOBUF_VERIFY_VERSION;
}

ProviderRegistry::ProviderRegistry(obs::Observer* obs)
    : ProviderRegistry(Bootstrap(&default_bootstrap), obs) {}

ProviderRegistry::ProviderRegistry(Bootstrap bootstrap, obs::Observer* obs)
    : bootstrap_(std::move(bootstrap)), obs_(obs::or_default(obs)) {}

ProviderRegistry::~ProviderRegistry() = default;

std::string ProviderRegistry::fold(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

//------------------------------- Bootstrap ------------------------------------

void ProviderRegistry::bootstrap() {
    std::call_once(boot_once_, [this] {
        if (bootstrap_) bootstrap_();
        bootstraps_.fetch_add(1, std::memory_order_relaxed);
        obs_->record(obs::LifecycleEvent{"registry", "", "bootstrap", ""});
    });
}

//------------------------------- Mutations ------------------------------------

Result<void> ProviderRegistry::load(const std::string& path) {
    bootstrap();

    std::lock_guard<std::mutex> lk(write_mu_);
    auto fail = [&](const Error& e) -> Result<void> {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        obs_->record(obs::LifecycleEvent{"registry", path, "load_failed", e.describe()});
        return csimux_detail::unexpected<Error>(e);
    };

    auto lib = os::DynLib::open(path);
    if (!lib) return fail(lib.error());

    auto sym = lib->symbol(PROVIDER_TABLE_SYMBOL);
    if (!sym) return fail(sym.error());

    auto entry_point = reinterpret_cast<csimux_service_providers_fn>(*sym);
    const csimux_provider_table* table = entry_point();
    if (!table) {
        return fail(Error{ErrorCode::InvalidProvider, path + ": provider table is null"});
    }
    if (table->abi_version != PROVIDER_ABI_VERSION) {
        return fail(Error{ErrorCode::ModuleAbiMismatch,
                          path + ": abi " + std::to_string(table->abi_version) + ", expected " +
                              std::to_string(PROVIDER_ABI_VERSION)});
    }
    if (table->count > 0 && !table->entries) {
        return fail(Error{ErrorCode::InvalidProvider, path + ": provider entries are null"});
    }

    std::vector<ProviderDescriptor> entries;
    entries.reserve(table->count);
    for (std::size_t i = 0; i < table->count; ++i) {
        const csimux_provider_entry& e = table->entries[i];
        if (!e.name || !e.create) {
            return fail(Error{ErrorCode::InvalidProvider,
                              path + ": entry " + std::to_string(i) + " has no name or constructor"});
        }
        auto create = e.create;
        entries.push_back(ProviderDescriptor{
            e.name, path, [create] { return std::unique_ptr<ServiceProvider>(create()); }});
    }

    if (auto r = publish(entries); !r) return fail(r.error());

    // Module stays mapped for the registry's lifetime.
    modules_.push_back(std::move(*lib));
    loads_.fetch_add(1, std::memory_order_relaxed);

    std::string names;
    for (const auto& e : entries) {
        if (!names.empty()) names += ",";
        names += e.name;
    }
    obs_->record(obs::LifecycleEvent{"registry", path, "load", names});
    return {};
}

Result<void> ProviderRegistry::load(std::span<const std::string> paths) {
    bootstrap();
    for (const auto& p : paths) {
        if (auto r = load(p); !r) return r;
    }
    return {};
}

Result<void> ProviderRegistry::add(std::string_view name, ProviderCtor ctor) {
    std::lock_guard<std::mutex> lk(write_mu_);
    std::vector<ProviderDescriptor> one{ProviderDescriptor{std::string(name), "", std::move(ctor)}};
    if (auto r = publish(one); !r) {
        add_failures_.fetch_add(1, std::memory_order_relaxed);
        return r;
    }
    adds_.fetch_add(1, std::memory_order_relaxed);
    obs_->record(obs::LifecycleEvent{"registry", std::string(name), "add", ""});
    return {};
}

Result<void> ProviderRegistry::publish(const std::vector<ProviderDescriptor>& entries) {
    auto snap = snapshot();
    std::unordered_set<std::string> seen;
    for (const auto& e : entries) {
        if (e.name.empty() || !e.ctor) {
            return make_error(ErrorCode::InvalidProvider, "provider '" + e.name + "' has no name or constructor");
        }
        const std::string key = fold(e.name);
        if (snap->count(key) != 0 || !seen.insert(key).second) {
            return make_error(ErrorCode::DuplicateProvider, "provider '" + e.name + "' already registered");
        }
    }

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    for (const auto& e : entries) {
        next->emplace(fold(e.name), std::make_shared<const ProviderDescriptor>(e));
    }
    // RCU update: RELEASE pairs with reader ACQUIRE.
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const ProviderRegistry::Map> ProviderRegistry::snapshot() const noexcept {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

Result<std::shared_ptr<const ProviderDescriptor>> ProviderRegistry::lookup(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->find(fold(name));
    if (it == snap->end()) {
        return make_error(ErrorCode::ProviderNotFound, "no provider named '" + std::string(name) + "'");
    }
    return it->second;
}

bool ProviderRegistry::contains(std::string_view name) const {
    auto snap = snapshot();
    return snap->find(fold(name)) != snap->end();
}

std::size_t ProviderRegistry::size() const noexcept {
    return snapshot()->size();
}

std::vector<std::string> ProviderRegistry::list_names() const {
    auto snap = snapshot();
    std::vector<std::string> out;
    out.reserve(snap->size());
    for (const auto& [key, desc] : *snap) out.push_back(desc->name);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> ProviderRegistry::modules() const {
    std::lock_guard<std::mutex> lk(write_mu_);
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (const auto& m : modules_) out.push_back(m.path());
    return out;
}

ProviderRegistry::Stats ProviderRegistry::stats() const noexcept {
    Stats s;
    s.bootstraps    = bootstraps_.load(std::memory_order_relaxed);
    s.loads         = loads_.load(std::memory_order_relaxed);
    s.load_failures = load_failures_.load(std::memory_order_relaxed);
    s.adds          = adds_.load(std::memory_order_relaxed);
    s.add_failures  = add_failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace csimux::provider
