/**
 * @file server.cpp
 * @brief Routing server implementation.
 */
#include "csimux/server/server.hpp"
#include "csimux/config/constants.hpp"
#include "csimux/transport/proto_addr.hpp"
#include "csimux/transport/socket_listener.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace csimux::server {

using csimux::config::constants::ROUTING_METADATA_KEY;

static bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

Server::Server(std::string address, std::vector<std::shared_ptr<service::Service>> services,
               obs::Observer* obs)
    : address_(std::move(address)),
      services_(std::move(services)),
      obs_(obs::or_default(obs)),
      host_([this](rpc::CallContext& ctx, const rpc::MethodEntry& m) -> rpc::ProtocolHandler* {
          return route(ctx, m.full_name);
      }) {}

Server::~Server() {
    stop();
}

//------------------------------- Serving --------------------------------------

Result<void> Server::serve(std::unique_ptr<transport::Listener> lis) {
    if (services_.empty()) {
        return make_error(ErrorCode::EmptyServices, "server has no services");
    }

    transport::Listener* bound = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_) return make_error(ErrorCode::ServerStopped, "server stopped");
        if (serving_) return make_error(ErrorCode::ServerStarted, "server already serving");

        if (!lis) {
            auto made = transport::listen(address_);
            if (!made) return csimux_detail::unexpected<Error>(made.error());
            lis = std::move(*made);
        }
        serving_ = true;

        const std::string network = lis->network();
        const std::string where   = lis->address();
        address_ = transport::format_proto_addr({network, where});
        if (transport::is_local_network(network)) {
            exit_handlers_.push_back([where] {
                std::error_code ec;
                std::filesystem::remove(where, ec);
            });
        }
        listener_ = std::move(lis);
        bound = listener_.get();
        start_services();
    }

    obs_->record(obs::LifecycleEvent{"server", address(), "serve",
                                     std::to_string(services_.size()) + " services"});

    auto r = host_.serve(*bound);
    if (!r && r.error().code == ErrorCode::ServerStopped) return {}; // stopped before the host started
    return r;
}

void Server::start_services() {
    auto results = results_;
    auto services = services_;
    supervisor_ = std::thread([results, services] {
        std::vector<std::thread> loops;
        loops.reserve(services.size());
        for (const auto& svc : services) {
            loops.emplace_back([results, svc] {
                results->push(ServiceOutcome{svc->name(), svc->serve()});
            });
        }
        for (auto& t : loops) t.join();
        results->close();
    });
}

void Server::join_services() {
    std::lock_guard<std::mutex> lk(join_mu_);
    if (supervisor_.joinable()) supervisor_.join();
}

//------------------------------- Routing --------------------------------------

service::Service* Server::route(const rpc::CallContext& ctx, std::string_view method) {
    if (auto tag = ctx.metadata(ROUTING_METADATA_KEY)) {
        for (const auto& svc : services_) {
            if (iequals(*tag, svc->name())) {
                obs_->record(obs::RouteEvent{std::string(method), svc->type(), svc->name(), false});
                return svc.get();
            }
        }
    }
    const auto& first = services_.front();
    obs_->record(obs::RouteEvent{std::string(method), first->type(), first->name(), true});
    return first.get();
}

//------------------------------- Lifecycle ------------------------------------

void Server::stop() {
    transport::Listener* lis = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
        lis = listener_.get();
    }
    obs_->record(obs::LifecycleEvent{"server", address(), "stop", ""});
    for (const auto& svc : services_) svc->stop();
    if (lis) lis->close();
    host_.stop();
    run_exit_handlers();
    join_services();
}

void Server::graceful_stop() {
    transport::Listener* lis = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
        lis = listener_.get();
    }
    obs_->record(obs::LifecycleEvent{"server", address(), "graceful_stop", ""});
    for (const auto& svc : services_) svc->graceful_stop();
    if (lis) lis->close();
    host_.graceful_stop();
    run_exit_handlers();
    join_services();
}

void Server::shutdown(os::ShutdownMode mode) {
    if (mode == os::ShutdownMode::Forced) {
        stop();
    } else {
        graceful_stop();
    }
}

void Server::add_exit_handler(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    exit_handlers_.push_back(std::move(fn));
}

void Server::run_exit_handlers() {
    std::call_once(exit_once_, [this] {
        std::vector<std::function<void()>> handlers;
        {
            std::lock_guard<std::mutex> lk(mu_);
            handlers.swap(exit_handlers_);
        }
        for (auto& h : handlers) h();
    });
}

std::string Server::address() const {
    std::lock_guard<std::mutex> lk(mu_);
    return address_;
}

} // namespace csimux::server
