#pragma once
/**
 * @file server.hpp
 * @brief Routing server: many named Services behind one listener.
 *
 * Routing: the first value of the `csi.service` call-metadata key selects the
 * Service whose name matches case-insensitively; anything else goes to the first
 * configured Service.
 *
 * Lifecycle:
 *   • serve() fails with EmptyServices before binding when there are no Services.
 *   • Every Service is served on its own thread; their terminal results are
 *     delivered on service_results(), which closes once all of them returned.
 *   • stop(): stop every Service, stop the listener, run exit handlers.
 *   • graceful_stop(): drain every Service, drain the listener, run exit handlers.
 *   • Exit handlers run exactly once, whichever stop path (or the destructor) gets there first.
 */

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "csimux/error.hpp"
#include "csimux/obs/observability.hpp"
#include "csimux/os/signals.hpp"
#include "csimux/rpc/grpc_host.hpp"
#include "csimux/server/service_results.hpp"
#include "csimux/service/service.hpp"
#include "csimux/transport/listener.hpp"

namespace csimux::server {

class Server final {
public:
    /**
     * @param address  Listen endpoint "scheme://address" (ignored when serve() is given a listener).
     * @param services Services in routing order; the first is the default route.
     * @param obs      Event sink; nullptr selects the process default.
     */
    Server(std::string address, std::vector<std::shared_ptr<service::Service>> services,
           obs::Observer* obs = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Start all Services and serve the protocol until stopped. Blocks.
     * @param lis Pre-bound listener; nullptr binds one on the configured address.
     */
    Result<void> serve(std::unique_ptr<transport::Listener> lis = nullptr);

    void stop();
    void graceful_stop();

    /// Dispatch to stop() or graceful_stop().
    void shutdown(os::ShutdownMode mode);

    /// Register an action to run once when the server stops.
    void add_exit_handler(std::function<void()> fn);

    /// Configured address, or "network://address" of the bound listener once serving.
    [[nodiscard]] std::string address() const;

    [[nodiscard]] const std::vector<std::shared_ptr<service::Service>>& services() const noexcept { return services_; }

    /// Terminal results of the Services; closed after all of them stopped.
    [[nodiscard]] std::shared_ptr<ServiceResults> service_results() const noexcept { return results_; }

    /// Service selected for a call carrying `ctx`'s metadata.
    service::Service* route(const rpc::CallContext& ctx, std::string_view method);

private:
    void start_services();
    void join_services();
    void run_exit_handlers();

    std::string                                    address_;
    const std::vector<std::shared_ptr<service::Service>> services_;
    obs::Observer*                                 obs_;
    std::shared_ptr<ServiceResults>                results_{std::make_shared<ServiceResults>()};

    mutable std::mutex                             mu_;
    bool                                           serving_{false};
    bool                                           stopped_{false};
    std::unique_ptr<transport::Listener>           listener_;
    std::vector<std::function<void()>>             exit_handlers_;
    std::once_flag                                 exit_once_;

    std::mutex                                     join_mu_;
    std::thread                                    supervisor_;

    rpc::GrpcHost                                  host_;
};

} // namespace csimux::server
