/**
 * @file service.cpp
 * @brief Service validation, version gating and delegation.
 */
#include "csimux/service/service.hpp"
#include "csimux/rpc/errors.hpp"

#include <chrono>

#include <grpcpp/create_channel_posix.h>

namespace csimux::service {

using GeneralError = csi::Error::GeneralError;

namespace {

/// "missing id obj" / "missing id map" / nullopt.
template <class Request>
std::optional<std::string> missing_volume_id(const Request& req) {
    if (!req.has_volume_id()) return std::string("missing id obj");
    if (req.volume_id().values().empty()) return std::string("missing id map");
    return std::nullopt;
}

grpc::Status status_from(const Error& e) {
    switch (e.code) {
        case ErrorCode::Cancelled:        return grpc::Status(grpc::StatusCode::CANCELLED, e.describe());
        case ErrorCode::DeadlineExceeded: return grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, e.describe());
        default:                          return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.describe());
    }
}

} // namespace

Service::Service(std::string type, std::string name,
                 std::unique_ptr<provider::ServiceProvider> provider, obs::Observer* obs)
    : type_(std::move(type)),
      name_(std::move(name)),
      provider_(std::move(provider)),
      obs_(obs::or_default(obs)),
      pipe_(name_) {
    obs_->record(obs::LifecycleEvent{"service", name_, "new", "type=" + type_});
}

Service::~Service() {
    stop();
    std::lock_guard<std::mutex> lk(dial_mu_);
    client_.reset();
}

//------------------------------- Lifecycle ------------------------------------

Result<void> Service::serve() { return serve(pipe_); }

Result<void> Service::serve(transport::Listener& lis) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return make_error(ErrorCode::ServerStopped, "service " + name_ + " is stopped");
        if (started_) return make_error(ErrorCode::ServerStarted, "service " + name_ + " already serving");
        started_ = true;
    }
    obs_->record(obs::LifecycleEvent{"service", name_, "serve", lis.network() + "://" + lis.address()});
    auto r = provider_->serve(lis);
    obs_->record(obs::LifecycleEvent{"service", name_, "served", r ? "" : r.error().describe()});
    // Nobody accepts on the channel any more.
    close_channel();
    return r;
}

void Service::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (forced_) return;
        forced_ = true;
        stopping_ = true;
    }
    obs_->record(obs::LifecycleEvent{"service", name_, "stop", ""});
    provider_->stop();
    close_channel();
}

void Service::graceful_stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return;
        stopping_ = true;
    }
    obs_->record(obs::LifecycleEvent{"service", name_, "graceful_stop", ""});
    provider_->graceful_stop();
    close_channel();
}

bool Service::stopped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stopping_;
}

void Service::close_channel() {
    // Closing first unblocks a connect() parked in dial().
    pipe_.close();
    std::lock_guard<std::mutex> lk(dial_mu_);
    client_.reset();
}

//------------------------------- Delegation -----------------------------------

Service::RpcResult<std::shared_ptr<rpc::ProtocolClient>> Service::connect(rpc::CallContext& ctx) {
    {
        std::lock_guard<std::mutex> lk(dial_mu_);
        if (client_) return client_;
    }

    auto conn = pipe_.dial([&ctx]() -> std::optional<Error> {
        if (ctx.cancelled()) return Error{ErrorCode::Cancelled, "call cancelled while dialing"};
        if (auto d = ctx.deadline(); d && std::chrono::system_clock::now() >= *d) {
            return Error{ErrorCode::DeadlineExceeded, "deadline passed while dialing"};
        }
        return std::nullopt;
    });
    if (!conn) return csimux_detail::unexpected<grpc::Status>(status_from(conn.error()));
    if (auto nb = conn->set_nonblocking(true); !nb) {
        return csimux_detail::unexpected<grpc::Status>(status_from(nb.error()));
    }
    auto fresh = std::make_shared<rpc::ProtocolClient>(grpc::CreateInsecureChannelFromFd(name_, conn->release()));

    // Concurrent first callers may each dial; the first to publish wins.
    std::lock_guard<std::mutex> lk(dial_mu_);
    if (pipe_.closed()) {
        return csimux_detail::unexpected<grpc::Status>(
            status_from(Error{ErrorCode::Closed, "pipe " + name_ + " closed"}));
    }
    if (!client_) client_ = std::move(fresh);
    return client_;
}

Service::RpcResult<Service::VersionSet> Service::supported_versions(rpc::CallContext& ctx) {
    std::call_once(versions_once_, [&] { versions_ = fetch_versions(ctx); });
    return versions_;
}

Service::RpcResult<Service::VersionSet> Service::fetch_versions(rpc::CallContext& ctx) {
    auto client = connect(ctx);
    if (!client) return csimux_detail::unexpected<grpc::Status>(client.error());

    csi::GetSupportedVersionsResponse resp;
    if (auto st = (*client)->call(ctx, csi::GetSupportedVersionsRequest{}, &resp); !st.ok()) {
        return csimux_detail::unexpected<grpc::Status>(st);
    }
    if (resp.has_error()) {
        return csimux_detail::unexpected<grpc::Status>(grpc::Status(
            grpc::StatusCode::UNKNOWN, "GetSupportedVersions failed: " + rpc::describe(resp.error())));
    }
    if (!resp.has_result()) {
        return csimux_detail::unexpected<grpc::Status>(
            grpc::Status(grpc::StatusCode::UNKNOWN, "GetSupportedVersions returned no result"));
    }
    const auto& list = resp.result().supported_versions();
    obs_->record(obs::LifecycleEvent{"service", name_, "versions", std::to_string(list.size())});
    return VersionSet(list.begin(), list.end());
}

std::optional<std::string> Service::version_problem(bool has_version, const csi::Version& declared,
                                                    const VersionSet& supported) {
    if (!has_version) return std::string("missing request version");
    for (const auto& v : supported) {
        if (rpc::same_version(v, declared)) return std::nullopt;
    }
    return "unsupported request version: " + rpc::format_version(declared);
}

template <class Request, class Response>
Service::RpcResult<std::shared_ptr<rpc::ProtocolClient>>
Service::admit(rpc::CallContext& ctx, const Request& req, Response* resp) {
    auto client = connect(ctx);
    if (!client) return client;

    auto versions = supported_versions(ctx);
    if (!versions) return csimux_detail::unexpected<grpc::Status>(versions.error());

    if (auto why = version_problem(req.has_version(), req.version(), *versions)) {
        rpc::set_general_error(resp, GeneralError::UNSUPPORTED_REQUEST_VERSION, *why);
        reject(rpc::MethodTraits<Request>::short_name, *why);
        return csimux_detail::unexpected<grpc::Status>(grpc::Status::OK);
    }
    return client;
}

template <class Request, class Response>
grpc::Status Service::forward(rpc::CallContext& ctx, const Request& req, Response* resp) {
    auto client = admit(ctx, req, resp);
    if (!client) return client.error();
    return (*client)->call(ctx, req, resp);
}

void Service::reject(const char* method, const std::string& reason) {
    obs_->record(obs::RejectEvent{name_, method, reason});
}

//------------------------------- Controller -----------------------------------

grpc::Status Service::CreateVolume(rpc::CallContext& ctx, const csi::CreateVolumeRequest& req,
                                   csi::CreateVolumeResponse* resp) {
    auto client = admit(ctx, req, resp);
    if (!client) return client.error();
    if (req.name().empty()) {
        rpc::set_create_volume_error(resp, csi::Error::CreateVolumeError::INVALID_VOLUME_NAME, "missing name");
        reject("CreateVolume", "missing name");
        return grpc::Status::OK;
    }
    return (*client)->call(ctx, req, resp);
}

grpc::Status Service::DeleteVolume(rpc::CallContext& ctx, const csi::DeleteVolumeRequest& req,
                                   csi::DeleteVolumeResponse* resp) {
    if (auto why = missing_volume_id(req)) {
        rpc::set_delete_volume_error(resp, csi::Error::DeleteVolumeError::INVALID_VOLUME_ID, *why);
        reject("DeleteVolume", *why);
        return grpc::Status::OK;
    }
    return forward(ctx, req, resp);
}

grpc::Status Service::ControllerPublishVolume(rpc::CallContext& ctx,
                                              const csi::ControllerPublishVolumeRequest& req,
                                              csi::ControllerPublishVolumeResponse* resp) {
    if (auto why = missing_volume_id(req)) {
        rpc::set_controller_publish_volume_error(
            resp, csi::Error::ControllerPublishVolumeError::INVALID_VOLUME_ID, *why);
        reject("ControllerPublishVolume", *why);
        return grpc::Status::OK;
    }
    return forward(ctx, req, resp);
}

grpc::Status Service::ControllerUnpublishVolume(rpc::CallContext& ctx,
                                                const csi::ControllerUnpublishVolumeRequest& req,
                                                csi::ControllerUnpublishVolumeResponse* resp) {
    if (auto why = missing_volume_id(req)) {
        rpc::set_controller_unpublish_volume_error(
            resp, csi::Error::ControllerUnpublishVolumeError::INVALID_VOLUME_ID, *why);
        reject("ControllerUnpublishVolume", *why);
        return grpc::Status::OK;
    }
    return forward(ctx, req, resp);
}

grpc::Status Service::ValidateVolumeCapabilities(rpc::CallContext& ctx,
                                                 const csi::ValidateVolumeCapabilitiesRequest& req,
                                                 csi::ValidateVolumeCapabilitiesResponse* resp) {
    return forward(ctx, req, resp);
}

grpc::Status Service::ListVolumes(rpc::CallContext& ctx, const csi::ListVolumesRequest& req,
                                  csi::ListVolumesResponse* resp) {
    return forward(ctx, req, resp);
}

grpc::Status Service::GetCapacity(rpc::CallContext& ctx, const csi::GetCapacityRequest& req,
                                  csi::GetCapacityResponse* resp) {
    return forward(ctx, req, resp);
}

grpc::Status Service::ControllerGetCapabilities(rpc::CallContext& ctx,
                                                const csi::ControllerGetCapabilitiesRequest& req,
                                                csi::ControllerGetCapabilitiesResponse* resp) {
    return forward(ctx, req, resp);
}

//------------------------------- Identity -------------------------------------

grpc::Status Service::GetSupportedVersions(rpc::CallContext& ctx, const csi::GetSupportedVersionsRequest&,
                                           csi::GetSupportedVersionsResponse* resp) {
    auto versions = supported_versions(ctx);
    if (!versions) return versions.error();
    auto* result = resp->mutable_result();
    for (const auto& v : *versions) *result->add_supported_versions() = v;
    return grpc::Status::OK;
}

grpc::Status Service::GetPluginInfo(rpc::CallContext& ctx, const csi::GetPluginInfoRequest& req,
                                    csi::GetPluginInfoResponse* resp) {
    return forward(ctx, req, resp);
}

//------------------------------- Node -----------------------------------------

grpc::Status Service::NodePublishVolume(rpc::CallContext& ctx, const csi::NodePublishVolumeRequest& req,
                                        csi::NodePublishVolumeResponse* resp) {
    if (auto why = missing_volume_id(req)) {
        rpc::set_general_error(resp, GeneralError::MISSING_REQUIRED_FIELD, *why);
        reject("NodePublishVolume", *why);
        return grpc::Status::OK;
    }
    return forward(ctx, req, resp);
}

grpc::Status Service::NodeUnpublishVolume(rpc::CallContext& ctx, const csi::NodeUnpublishVolumeRequest& req,
                                          csi::NodeUnpublishVolumeResponse* resp) {
    if (auto why = missing_volume_id(req)) {
        rpc::set_general_error(resp, GeneralError::MISSING_REQUIRED_FIELD, *why);
        reject("NodeUnpublishVolume", *why);
        return grpc::Status::OK;
    }
    return forward(ctx, req, resp);
}

grpc::Status Service::GetNodeID(rpc::CallContext& ctx, const csi::GetNodeIDRequest& req,
                                csi::GetNodeIDResponse* resp) {
    return forward(ctx, req, resp);
}

grpc::Status Service::ProbeNode(rpc::CallContext& ctx, const csi::ProbeNodeRequest& req,
                                csi::ProbeNodeResponse* resp) {
    return forward(ctx, req, resp);
}

grpc::Status Service::NodeGetCapabilities(rpc::CallContext& ctx, const csi::NodeGetCapabilitiesRequest& req,
                                          csi::NodeGetCapabilitiesResponse* resp) {
    return forward(ctx, req, resp);
}

//------------------------------- Factory --------------------------------------

Result<std::shared_ptr<Service>> make_service(provider::ProviderRegistry& registry,
                                              const std::string& type, const std::string& name,
                                              obs::Observer* obs) {
    registry.bootstrap();
    auto desc = registry.lookup(type);
    if (!desc) return csimux_detail::unexpected<Error>(desc.error());

    auto instance = (*desc)->create();
    if (!instance) {
        return make_error(ErrorCode::InvalidProvider, "provider '" + (*desc)->name + "' constructor returned null");
    }
    return std::make_shared<Service>((*desc)->name, name.empty() ? type : name, std::move(instance), obs);
}

} // namespace csimux::service
