/**
 * @file methods.cpp
 * @brief Dispatch table: one row per MethodTraits specialization.
 */
#include "csimux/rpc/methods.hpp"
#include "csimux/rpc/codec.hpp"

#include <array>

namespace csimux::rpc {

namespace {

template <class Request>
using Handler = grpc::Status (ProtocolHandler::*)(CallContext&, const Request&,
                                                  typename MethodTraits<Request>::Response*);

template <class Request, Handler<Request> Fn>
grpc::Status invoke(ProtocolHandler& h, CallContext& ctx, grpc::ByteBuffer* in, grpc::ByteBuffer* out) {
    Request req;
    if (auto st = decode(in, &req); !st.ok()) return st;
    typename MethodTraits<Request>::Response resp;
    if (auto st = (h.*Fn)(ctx, req, &resp); !st.ok()) return st;
    return encode(resp, out);
}

template <class Request, Handler<Request> Fn>
constexpr MethodEntry row() {
    return MethodEntry{MethodTraits<Request>::full_name, MethodTraits<Request>::short_name,
                       &invoke<Request, Fn>};
}

constexpr std::array kMethods{
    row<csi::CreateVolumeRequest, &ProtocolHandler::CreateVolume>(),
    row<csi::DeleteVolumeRequest, &ProtocolHandler::DeleteVolume>(),
    row<csi::ControllerPublishVolumeRequest, &ProtocolHandler::ControllerPublishVolume>(),
    row<csi::ControllerUnpublishVolumeRequest, &ProtocolHandler::ControllerUnpublishVolume>(),
    row<csi::ValidateVolumeCapabilitiesRequest, &ProtocolHandler::ValidateVolumeCapabilities>(),
    row<csi::ListVolumesRequest, &ProtocolHandler::ListVolumes>(),
    row<csi::GetCapacityRequest, &ProtocolHandler::GetCapacity>(),
    row<csi::ControllerGetCapabilitiesRequest, &ProtocolHandler::ControllerGetCapabilities>(),
    row<csi::GetSupportedVersionsRequest, &ProtocolHandler::GetSupportedVersions>(),
    row<csi::GetPluginInfoRequest, &ProtocolHandler::GetPluginInfo>(),
    row<csi::NodePublishVolumeRequest, &ProtocolHandler::NodePublishVolume>(),
    row<csi::NodeUnpublishVolumeRequest, &ProtocolHandler::NodeUnpublishVolume>(),
    row<csi::GetNodeIDRequest, &ProtocolHandler::GetNodeID>(),
    row<csi::ProbeNodeRequest, &ProtocolHandler::ProbeNode>(),
    row<csi::NodeGetCapabilitiesRequest, &ProtocolHandler::NodeGetCapabilities>(),
};

} // namespace

std::span<const MethodEntry> all_methods() noexcept { return kMethods; }

const MethodEntry* find_method(std::string_view full_name) noexcept {
    for (const auto& m : kMethods) {
        if (full_name == m.full_name) return &m;
    }
    return nullptr;
}

} // namespace csimux::rpc
