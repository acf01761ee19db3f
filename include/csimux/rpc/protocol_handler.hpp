#pragma once
/**
 * @file protocol_handler.hpp
 * @brief The storage-protocol method set (Identity, Controller, Node).
 *
 * Every handler returns a gRPC status. Domain errors are reported by filling the
 * `error` branch of the response and returning OK; a non-OK status means the
 * call itself failed (transport, cancellation, deadline).
 */

#include <grpcpp/support/status.h>

#include "csimux/rpc/call_context.hpp"
#include "proto/csi.pb.h"

namespace csimux::rpc {

class ProtocolHandler {
public:
    virtual ~ProtocolHandler() = default;

    // Controller
    virtual grpc::Status CreateVolume(CallContext& ctx, const csi::CreateVolumeRequest& req,
                                      csi::CreateVolumeResponse* resp) = 0;
    virtual grpc::Status DeleteVolume(CallContext& ctx, const csi::DeleteVolumeRequest& req,
                                      csi::DeleteVolumeResponse* resp) = 0;
    virtual grpc::Status ControllerPublishVolume(CallContext& ctx,
                                                 const csi::ControllerPublishVolumeRequest& req,
                                                 csi::ControllerPublishVolumeResponse* resp) = 0;
    virtual grpc::Status ControllerUnpublishVolume(CallContext& ctx,
                                                   const csi::ControllerUnpublishVolumeRequest& req,
                                                   csi::ControllerUnpublishVolumeResponse* resp) = 0;
    virtual grpc::Status ValidateVolumeCapabilities(CallContext& ctx,
                                                    const csi::ValidateVolumeCapabilitiesRequest& req,
                                                    csi::ValidateVolumeCapabilitiesResponse* resp) = 0;
    virtual grpc::Status ListVolumes(CallContext& ctx, const csi::ListVolumesRequest& req,
                                     csi::ListVolumesResponse* resp) = 0;
    virtual grpc::Status GetCapacity(CallContext& ctx, const csi::GetCapacityRequest& req,
                                     csi::GetCapacityResponse* resp) = 0;
    virtual grpc::Status ControllerGetCapabilities(CallContext& ctx,
                                                   const csi::ControllerGetCapabilitiesRequest& req,
                                                   csi::ControllerGetCapabilitiesResponse* resp) = 0;

    // Identity
    virtual grpc::Status GetSupportedVersions(CallContext& ctx, const csi::GetSupportedVersionsRequest& req,
                                              csi::GetSupportedVersionsResponse* resp) = 0;
    virtual grpc::Status GetPluginInfo(CallContext& ctx, const csi::GetPluginInfoRequest& req,
                                       csi::GetPluginInfoResponse* resp) = 0;

    // Node
    virtual grpc::Status NodePublishVolume(CallContext& ctx, const csi::NodePublishVolumeRequest& req,
                                           csi::NodePublishVolumeResponse* resp) = 0;
    virtual grpc::Status NodeUnpublishVolume(CallContext& ctx, const csi::NodeUnpublishVolumeRequest& req,
                                             csi::NodeUnpublishVolumeResponse* resp) = 0;
    virtual grpc::Status GetNodeID(CallContext& ctx, const csi::GetNodeIDRequest& req,
                                   csi::GetNodeIDResponse* resp) = 0;
    virtual grpc::Status ProbeNode(CallContext& ctx, const csi::ProbeNodeRequest& req,
                                   csi::ProbeNodeResponse* resp) = 0;
    virtual grpc::Status NodeGetCapabilities(CallContext& ctx, const csi::NodeGetCapabilitiesRequest& req,
                                             csi::NodeGetCapabilitiesResponse* resp) = 0;
};

} // namespace csimux::rpc
