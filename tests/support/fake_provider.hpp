#pragma once
/**
 * @file fake_provider.hpp
 * @brief Scriptable provider for Service/Server tests.
 *
 * - GetSupportedVersions answers from a fixed list (or a domain error) and counts calls.
 * - GetPluginInfo answers with the provider's label, so routing is observable.
 * - ListVolumes can be held: it parks until release() or until the call is cancelled.
 * - Every other method returns an empty result and bumps `calls`.
 */

#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "csimux/provider/grpc_provider.hpp"

namespace csimux::test {

inline csi::Version ver(std::uint32_t major, std::uint32_t minor, std::uint32_t patch) {
  csi::Version v;
  v.set_major(major);
  v.set_minor(minor);
  v.set_patch(patch);
  return v;
}

class FakeProvider final : public provider::GrpcProvider {
public:
  explicit FakeProvider(std::string label = "fake",
                        std::vector<csi::Version> versions = {ver(0, 1, 0)})
    : label_(std::move(label)), versions_(std::move(versions)) {}

  std::atomic<int>  version_calls{0};   ///< GetSupportedVersions received
  std::atomic<int>  calls{0};           ///< any other method received
  std::atomic<int>  parked{0};          ///< ListVolumes calls currently held
  std::atomic<int>  cancelled_calls{0}; ///< held calls that ended by cancellation
  std::atomic<bool> versions_fail{false};

  void hold() { held_.store(true); }
  void release() { held_.store(false); }

  grpc::Status GetSupportedVersions(rpc::CallContext&, const csi::GetSupportedVersionsRequest&,
                                    csi::GetSupportedVersionsResponse* resp) override {
    ++version_calls;
    if (versions_fail.load()) {
      auto* ge = resp->mutable_error()->mutable_general_error();
      ge->set_error_code(csi::Error::GeneralError::UNDEFINED);
      ge->set_error_description("versions unavailable");
      return grpc::Status::OK;
    }
    auto* r = resp->mutable_result();
    for (const auto& v : versions_) *r->add_supported_versions() = v;
    return grpc::Status::OK;
  }

  grpc::Status GetPluginInfo(rpc::CallContext&, const csi::GetPluginInfoRequest&,
                             csi::GetPluginInfoResponse* resp) override {
    ++calls;
    resp->mutable_result()->set_name(label_);
    return grpc::Status::OK;
  }

  grpc::Status ListVolumes(rpc::CallContext& ctx, const csi::ListVolumesRequest&,
                           csi::ListVolumesResponse* resp) override {
    ++calls;
    ++parked;
    while (held_.load()) {
      if (ctx.wait_cancelled_for(std::chrono::milliseconds(5))) {
        --parked;
        ++cancelled_calls;
        return grpc::Status(grpc::StatusCode::CANCELLED, "cancelled while held");
      }
    }
    --parked;
    auto* e = resp->mutable_result()->add_entries();
    (*e->mutable_volume_info()->mutable_id()->mutable_values())["id"] = label_;
    return grpc::Status::OK;
  }

  grpc::Status CreateVolume(rpc::CallContext&, const csi::CreateVolumeRequest&,
                            csi::CreateVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status DeleteVolume(rpc::CallContext&, const csi::DeleteVolumeRequest&,
                            csi::DeleteVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status ControllerPublishVolume(rpc::CallContext&, const csi::ControllerPublishVolumeRequest&,
                                       csi::ControllerPublishVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status ControllerUnpublishVolume(rpc::CallContext&, const csi::ControllerUnpublishVolumeRequest&,
                                         csi::ControllerUnpublishVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status ValidateVolumeCapabilities(rpc::CallContext&, const csi::ValidateVolumeCapabilitiesRequest&,
                                          csi::ValidateVolumeCapabilitiesResponse* resp) override {
    return empty(resp);
  }
  grpc::Status GetCapacity(rpc::CallContext&, const csi::GetCapacityRequest&,
                           csi::GetCapacityResponse* resp) override {
    return empty(resp);
  }
  grpc::Status ControllerGetCapabilities(rpc::CallContext&, const csi::ControllerGetCapabilitiesRequest&,
                                         csi::ControllerGetCapabilitiesResponse* resp) override {
    return empty(resp);
  }
  grpc::Status NodePublishVolume(rpc::CallContext&, const csi::NodePublishVolumeRequest&,
                                 csi::NodePublishVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status NodeUnpublishVolume(rpc::CallContext&, const csi::NodeUnpublishVolumeRequest&,
                                   csi::NodeUnpublishVolumeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status GetNodeID(rpc::CallContext&, const csi::GetNodeIDRequest&,
                         csi::GetNodeIDResponse* resp) override {
    return empty(resp);
  }
  grpc::Status ProbeNode(rpc::CallContext&, const csi::ProbeNodeRequest&,
                         csi::ProbeNodeResponse* resp) override {
    return empty(resp);
  }
  grpc::Status NodeGetCapabilities(rpc::CallContext&, const csi::NodeGetCapabilitiesRequest&,
                                   csi::NodeGetCapabilitiesResponse* resp) override {
    return empty(resp);
  }

private:
  template <class Response>
  grpc::Status empty(Response* resp) {
    ++calls;
    resp->mutable_result();
    return grpc::Status::OK;
  }

  const std::string               label_;
  const std::vector<csi::Version> versions_;
  std::atomic<bool>               held_{false};
};

} // namespace csimux::test
