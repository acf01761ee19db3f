#pragma once
/**
 * @file methods.hpp
 * @brief Static description of every storage-protocol method.
 *
 * MethodTraits maps a request type to its response type and wire names; it is
 * used by ProtocolClient. The name-keyed dispatch table used by GrpcHost is
 * built from the same traits.
 */

#include <span>
#include <string_view>

#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/status.h>

#include "csimux/rpc/protocol_handler.hpp"

namespace csimux::rpc {

/// Request type -> response type and wire names.
template <class Request>
struct MethodTraits;

// ---------------------------- Controller -------------------------------------
template <>
struct MethodTraits<csi::CreateVolumeRequest> {
    using Response = csi::CreateVolumeResponse;
    static constexpr const char* full_name  = "/csi.Controller/CreateVolume";
    static constexpr const char* short_name = "CreateVolume";
};

template <>
struct MethodTraits<csi::DeleteVolumeRequest> {
    using Response = csi::DeleteVolumeResponse;
    static constexpr const char* full_name  = "/csi.Controller/DeleteVolume";
    static constexpr const char* short_name = "DeleteVolume";
};

template <>
struct MethodTraits<csi::ControllerPublishVolumeRequest> {
    using Response = csi::ControllerPublishVolumeResponse;
    static constexpr const char* full_name  = "/csi.Controller/ControllerPublishVolume";
    static constexpr const char* short_name = "ControllerPublishVolume";
};

template <>
struct MethodTraits<csi::ControllerUnpublishVolumeRequest> {
    using Response = csi::ControllerUnpublishVolumeResponse;
    static constexpr const char* full_name  = "/csi.Controller/ControllerUnpublishVolume";
    static constexpr const char* short_name = "ControllerUnpublishVolume";
};

template <>
struct MethodTraits<csi::ValidateVolumeCapabilitiesRequest> {
    using Response = csi::ValidateVolumeCapabilitiesResponse;
    static constexpr const char* full_name  = "/csi.Controller/ValidateVolumeCapabilities";
    static constexpr const char* short_name = "ValidateVolumeCapabilities";
};

template <>
struct MethodTraits<csi::ListVolumesRequest> {
    using Response = csi::ListVolumesResponse;
    static constexpr const char* full_name  = "/csi.Controller/ListVolumes";
    static constexpr const char* short_name = "ListVolumes";
};

template <>
struct MethodTraits<csi::GetCapacityRequest> {
    using Response = csi::GetCapacityResponse;
    static constexpr const char* full_name  = "/csi.Controller/GetCapacity";
    static constexpr const char* short_name = "GetCapacity";
};

template <>
struct MethodTraits<csi::ControllerGetCapabilitiesRequest> {
    using Response = csi::ControllerGetCapabilitiesResponse;
    static constexpr const char* full_name  = "/csi.Controller/ControllerGetCapabilities";
    static constexpr const char* short_name = "ControllerGetCapabilities";
};

// ---------------------------- Identity ---------------------------------------
template <>
struct MethodTraits<csi::GetSupportedVersionsRequest> {
    using Response = csi::GetSupportedVersionsResponse;
    static constexpr const char* full_name  = "/csi.Identity/GetSupportedVersions";
    static constexpr const char* short_name = "GetSupportedVersions";
};

template <>
struct MethodTraits<csi::GetPluginInfoRequest> {
    using Response = csi::GetPluginInfoResponse;
    static constexpr const char* full_name  = "/csi.Identity/GetPluginInfo";
    static constexpr const char* short_name = "GetPluginInfo";
};

// ---------------------------- Node -------------------------------------------
template <>
struct MethodTraits<csi::NodePublishVolumeRequest> {
    using Response = csi::NodePublishVolumeResponse;
    static constexpr const char* full_name  = "/csi.Node/NodePublishVolume";
    static constexpr const char* short_name = "NodePublishVolume";
};

template <>
struct MethodTraits<csi::NodeUnpublishVolumeRequest> {
    using Response = csi::NodeUnpublishVolumeResponse;
    static constexpr const char* full_name  = "/csi.Node/NodeUnpublishVolume";
    static constexpr const char* short_name = "NodeUnpublishVolume";
};

template <>
struct MethodTraits<csi::GetNodeIDRequest> {
    using Response = csi::GetNodeIDResponse;
    static constexpr const char* full_name  = "/csi.Node/GetNodeID";
    static constexpr const char* short_name = "GetNodeID";
};

template <>
struct MethodTraits<csi::ProbeNodeRequest> {
    using Response = csi::ProbeNodeResponse;
    static constexpr const char* full_name  = "/csi.Node/ProbeNode";
    static constexpr const char* short_name = "ProbeNode";
};

template <>
struct MethodTraits<csi::NodeGetCapabilitiesRequest> {
    using Response = csi::NodeGetCapabilitiesResponse;
    static constexpr const char* full_name  = "/csi.Node/NodeGetCapabilities";
    static constexpr const char* short_name = "NodeGetCapabilities";
};

/// Decode the request, call the handler, encode the response.
using Invoker = grpc::Status (*)(ProtocolHandler& handler, CallContext& ctx,
                                 grpc::ByteBuffer* request, grpc::ByteBuffer* response);

/** @struct MethodEntry
 *  @brief One row of the dispatch table.
 */
struct MethodEntry {
    const char* full_name;   ///< "/csi.Controller/CreateVolume"
    const char* short_name;  ///< "CreateVolume"
    Invoker     invoke;
};

/// All methods, in declaration order.
[[nodiscard]] std::span<const MethodEntry> all_methods() noexcept;

/// Entry for a full method name, or nullptr if the method is unknown.
[[nodiscard]] const MethodEntry* find_method(std::string_view full_name) noexcept;

} // namespace csimux::rpc
