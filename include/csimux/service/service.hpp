#pragma once
/**
 * @file service.hpp
 * @brief Named, validated, version-gated binding of one provider instance.
 *
 * A Service owns its provider and a private PipeListener. serve() runs the
 * provider on that channel; every protocol call is checked and then delegated to
 * the provider through a gRPC channel dialed over the same pipe.
 *
 * Per call:
 *   1. Required identifiers are checked (order depends on the method).
 *   2. The request version must equal one of the provider's supported versions.
 *      The set is fetched once, on first use, and shared by every caller.
 *   3. The call is forwarded; the provider's response or status is returned as is.
 * Rejections in 1 and 2 are successful RPCs carrying a `csi.Error` payload.
 *
 * Thread-safety: protocol methods may be called concurrently. Lifecycle flags are
 * guarded by a mutex that is never held while delegating. Dialing the private
 * channel honours the caller's cancellation and deadline; no lock is held while
 * it waits.
 *
 * The version fetch runs on the first caller's context. If that caller cancels
 * or times out, the failed fetch is what every later caller sees for the life
 * of the Service.
 *
 * When the provider's serve() returns, for whatever reason, the private channel
 * is closed and later calls fail with UNAVAILABLE.
 */

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <grpcpp/support/status.h>

#include "csimux/compat/expected.hpp"
#include "csimux/obs/observability.hpp"
#include "csimux/provider/provider_registry.hpp"
#include "csimux/provider/service_provider.hpp"
#include "csimux/rpc/client.hpp"
#include "csimux/transport/pipe_listener.hpp"

namespace csimux::service {

class Service final : public provider::ServiceProvider {
public:
    using VersionSet = std::vector<csi::Version>;
    template <class T>
    using RpcResult = csimux_detail::expected<T, grpc::Status>;

    /**
     * @param type     Registered provider name.
     * @param name     Service name used for routing.
     * @param provider Provider instance; owned by the Service.
     * @param obs      Event sink; nullptr selects the process default.
     */
    Service(std::string type, std::string name,
            std::unique_ptr<provider::ServiceProvider> provider,
            obs::Observer* obs = nullptr);
    ~Service() override;

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& type() const noexcept { return type_; }

    // --------------------------- Lifecycle -----------------------------------
    /// Serve the provider on the private channel. Blocks until stopped.
    Result<void> serve();

    /// Serve the provider on an external listener instead of the private channel.
    Result<void> serve(transport::Listener& lis) override;

    /// Stop the provider immediately and close the channel. Escalates a running graceful stop.
    void stop() override;

    /// Drain the provider's in-flight calls, then close the channel.
    void graceful_stop() override;

    [[nodiscard]] bool stopped() const;

    // --------------------------- Version cache -------------------------------
    /// Supported versions, fetched from the provider on first use.
    RpcResult<VersionSet> supported_versions(rpc::CallContext& ctx);

    // --------------------------- Protocol ------------------------------------
    grpc::Status CreateVolume(rpc::CallContext& ctx, const csi::CreateVolumeRequest& req,
                              csi::CreateVolumeResponse* resp) override;
    grpc::Status DeleteVolume(rpc::CallContext& ctx, const csi::DeleteVolumeRequest& req,
                              csi::DeleteVolumeResponse* resp) override;
    grpc::Status ControllerPublishVolume(rpc::CallContext& ctx,
                                         const csi::ControllerPublishVolumeRequest& req,
                                         csi::ControllerPublishVolumeResponse* resp) override;
    grpc::Status ControllerUnpublishVolume(rpc::CallContext& ctx,
                                           const csi::ControllerUnpublishVolumeRequest& req,
                                           csi::ControllerUnpublishVolumeResponse* resp) override;
    grpc::Status ValidateVolumeCapabilities(rpc::CallContext& ctx,
                                            const csi::ValidateVolumeCapabilitiesRequest& req,
                                            csi::ValidateVolumeCapabilitiesResponse* resp) override;
    grpc::Status ListVolumes(rpc::CallContext& ctx, const csi::ListVolumesRequest& req,
                             csi::ListVolumesResponse* resp) override;
    grpc::Status GetCapacity(rpc::CallContext& ctx, const csi::GetCapacityRequest& req,
                             csi::GetCapacityResponse* resp) override;
    grpc::Status ControllerGetCapabilities(rpc::CallContext& ctx,
                                           const csi::ControllerGetCapabilitiesRequest& req,
                                           csi::ControllerGetCapabilitiesResponse* resp) override;

    grpc::Status GetSupportedVersions(rpc::CallContext& ctx, const csi::GetSupportedVersionsRequest& req,
                                      csi::GetSupportedVersionsResponse* resp) override;
    grpc::Status GetPluginInfo(rpc::CallContext& ctx, const csi::GetPluginInfoRequest& req,
                               csi::GetPluginInfoResponse* resp) override;

    grpc::Status NodePublishVolume(rpc::CallContext& ctx, const csi::NodePublishVolumeRequest& req,
                                   csi::NodePublishVolumeResponse* resp) override;
    grpc::Status NodeUnpublishVolume(rpc::CallContext& ctx, const csi::NodeUnpublishVolumeRequest& req,
                                     csi::NodeUnpublishVolumeResponse* resp) override;
    grpc::Status GetNodeID(rpc::CallContext& ctx, const csi::GetNodeIDRequest& req,
                           csi::GetNodeIDResponse* resp) override;
    grpc::Status ProbeNode(rpc::CallContext& ctx, const csi::ProbeNodeRequest& req,
                           csi::ProbeNodeResponse* resp) override;
    grpc::Status NodeGetCapabilities(rpc::CallContext& ctx, const csi::NodeGetCapabilitiesRequest& req,
                                     csi::NodeGetCapabilitiesResponse* resp) override;

private:
    /// Dial the private channel once and cache the client. Gives up when `ctx`
    /// is cancelled or its deadline passes.
    RpcResult<std::shared_ptr<rpc::ProtocolClient>> connect(rpc::CallContext& ctx);

    RpcResult<VersionSet> fetch_versions(rpc::CallContext& ctx);

    /// Why `declared` is not acceptable, or nullopt if it is.
    static std::optional<std::string> version_problem(bool has_version, const csi::Version& declared,
                                                      const VersionSet& supported);

    /// connect → version. Error holds the status to return (OK when a payload was set).
    template <class Request, class Response>
    RpcResult<std::shared_ptr<rpc::ProtocolClient>> admit(rpc::CallContext& ctx, const Request& req,
                                                          Response* resp);

    /// admit, then forward unchanged.
    template <class Request, class Response>
    grpc::Status forward(rpc::CallContext& ctx, const Request& req, Response* resp);

    void reject(const char* method, const std::string& reason);
    void close_channel();

    const std::string                          type_;
    const std::string                          name_;
    std::unique_ptr<provider::ServiceProvider> provider_;
    obs::Observer*                             obs_;
    transport::PipeListener                    pipe_;

    mutable std::mutex                     mu_;       // lifecycle flags
    bool                                   started_{false};
    bool                                   stopping_{false};
    bool                                   forced_{false};

    std::mutex                             dial_mu_;  // guards client_; never held across dial()
    std::shared_ptr<rpc::ProtocolClient>   client_;

    std::once_flag                         versions_once_;
    RpcResult<VersionSet>                  versions_{VersionSet{}};
};

/**
 * @brief Construct a provider from the registry and wrap it in a Service.
 * @param type Provider name (case-insensitive).
 * @param name Service name; empty means "same as type".
 */
Result<std::shared_ptr<Service>> make_service(provider::ProviderRegistry& registry,
                                              const std::string& type, const std::string& name,
                                              obs::Observer* obs = nullptr);

} // namespace csimux::service
