#pragma once
/**
 * @file mock_provider.hpp
 * @brief In-memory provider used by the daemon demo and the integration tests.
 *
 * Keeps a per-instance volume catalog seeded with a few volumes. Supports exactly
 * one protocol version (0.1.0). Create is idempotent by name; publish/unpublish
 * record per-node device paths in the volume metadata.
 *
 * Thread-safety: the catalog is guarded by one mutex.
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "csimux/config/constants.hpp"
#include "csimux/obs/observability.hpp"
#include "csimux/provider/grpc_provider.hpp"

namespace csimux::providers {

class MockProvider final : public provider::GrpcProvider {
public:
    explicit MockProvider(std::string name = config::constants::MOCK_PROVIDER_NAME,
                          obs::Observer* obs = nullptr);

    Result<void> serve(transport::Listener& lis) override;
    void stop() override;
    void graceful_stop() override;

    /// Number of volumes currently in the catalog.
    [[nodiscard]] std::size_t volume_count() const;

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
    csi::VolumeInfo make_volume(const std::string& name, std::uint64_t capacity);
    /// Index of the volume whose id value `field` equals `value` (case-insensitive), or -1.
    long find(const std::string& field, const std::string& value) const;

    const std::string            name_;
    obs::Observer*               obs_;
    mutable std::mutex           mu_;
    std::vector<csi::VolumeInfo> vols_;
    std::uint64_t                next_id_{0};
};

} // namespace csimux::providers
