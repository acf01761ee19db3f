/**
 * @file main.cpp
 * @brief csimuxd: serve several storage providers behind one endpoint.
 *
 * Usage: CSI_ENDPOINT=scheme://address csimuxd [MODULE...] TYPE[:NAME]...
 *
 * **Bootstrap**
 * - Parse argv + environment into a DaemonConfig.
 * - Load provider modules into a ProviderRegistry, in order.
 * - Build one Service per TYPE[:NAME]; the first one is the default route.
 *
 * **Lifecycle**
 * - The first TERM/INT/HUP/QUIT drains; a second one forces the stop.
 * - Exit status is 0 after a graceful stop, 1 after a forced stop or any error.
 */

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "csimux/config/config_loader.hpp"
#include "csimux/obs/observability.hpp"
#include "csimux/os/signals.hpp"
#include "csimux/provider/provider_registry.hpp"
#include "csimux/server/server.hpp"
#include "csimux/service/service.hpp"
#include "csimux/version.hpp"

using namespace csimux;

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  auto cfg = config::Loader::from_args(args, config::Loader::process_env());
  if (!cfg) {
    std::cerr << "csimuxd: " << cfg.error().describe() << "\n"
              << "usage: CSI_ENDPOINT=scheme://address csimuxd [MODULE...] TYPE[:NAME]...\n";
    return 1;
  }

  obs::Observer* obs = obs::make_simple_observer();
  obs->record(obs::LifecycleEvent{"daemon", "csimuxd", "start", version_string});

  // Declared first: providers created from loaded modules must die before it.
  provider::ProviderRegistry registry(obs);
  if (auto r = registry.load(cfg->module_paths); !r) {
    std::cerr << "csimuxd: " << r.error().describe() << "\n";
    return 1;
  }

  std::vector<std::shared_ptr<service::Service>> services;
  services.reserve(cfg->services.size());
  for (const auto& def : cfg->services) {
    auto svc = service::make_service(registry, def.type, def.name, obs);
    if (!svc) {
      std::cerr << "csimuxd: " << def.type << ":" << def.name << ": " << svc.error().describe() << "\n";
      return 1;
    }
    services.push_back(std::move(*svc));
  }

  server::Server server(cfg->endpoint, std::move(services), obs);

  std::atomic<bool> forced{false};
  auto trap = std::make_unique<os::SignalTrap>([&](os::ShutdownMode mode, int signo) {
    obs->record(obs::LifecycleEvent{"daemon", "csimuxd", "signal",
                                    std::to_string(signo) + " -> " + os::to_string(mode)});
    if (mode == os::ShutdownMode::Forced) forced.store(true, std::memory_order_release);
    server.shutdown(mode);
  });

  auto served = server.serve();

  // Joins a graceful stop still draining, then make sure everything is down.
  trap.reset();
  server.stop();

  int rc = 0;
  if (!served) {
    std::cerr << "csimuxd: " << served.error().describe() << "\n";
    rc = 1;
  }
  for (const auto& outcome : server.service_results()->wait_all()) {
    if (!outcome.result) {
      std::cerr << "csimuxd: service " << outcome.service << ": " << outcome.result.error().describe() << "\n";
      rc = 1;
    }
  }
  if (forced.load(std::memory_order_acquire)) rc = 1;

  obs->record(obs::LifecycleEvent{"daemon", "csimuxd", "exit", std::to_string(rc)});
  return rc;
}
