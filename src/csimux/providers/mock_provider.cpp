/**
 * @file mock_provider.cpp
 * @brief In-memory catalog behind the storage protocol.
 */
#include "csimux/providers/mock_provider.hpp"
#include "csimux/rpc/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <charconv>

namespace csimux::providers {

using namespace csimux::config::constants;
using PublishErr   = csi::Error::ControllerPublishVolumeError;
using UnpublishErr = csi::Error::ControllerUnpublishVolumeError;
using NodePubErr   = csi::Error::NodePublishVolumeError;
using NodeUnpubErr = csi::Error::NodeUnpublishVolumeError;
using GeneralErr   = csi::Error::GeneralError;

static const std::string kMountPathKey = std::string(MOCK_NODE_ID) + ".mntpath";

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

/// Value of values["id"], or nullptr.
template <class Msg>
static const std::string* id_value(const Msg& m) {
    auto it = m.values().find("id");
    return it == m.values().end() ? nullptr : &it->second;
}

MockProvider::MockProvider(std::string name, obs::Observer* obs)
    : name_(std::move(name)), obs_(obs::or_default(obs)) {
    for (std::size_t i = 1; i <= MOCK_SEED_VOLUMES; ++i) {
        vols_.push_back(make_volume("Mock Volume " + std::to_string(i), MOCK_DEFAULT_VOLUME_BYTES));
    }
}

Result<void> MockProvider::serve(transport::Listener& lis) {
    obs_->record(obs::LifecycleEvent{"provider", name_, "serve", lis.address()});
    return GrpcProvider::serve(lis);
}

void MockProvider::stop() {
    obs_->record(obs::LifecycleEvent{"provider", name_, "stop", ""});
    GrpcProvider::stop();
}

void MockProvider::graceful_stop() {
    obs_->record(obs::LifecycleEvent{"provider", name_, "graceful_stop", ""});
    GrpcProvider::graceful_stop();
}

std::size_t MockProvider::volume_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return vols_.size();
}

csi::VolumeInfo MockProvider::make_volume(const std::string& name, std::uint64_t capacity) {
    csi::VolumeInfo vi;
    auto& ids = *vi.mutable_id()->mutable_values();
    ids["id"]   = std::to_string(++next_id_);
    ids["name"] = name;
    vi.mutable_metadata();
    vi.set_capacity_bytes(capacity);
    return vi;
}

long MockProvider::find(const std::string& field, const std::string& value) const {
    for (std::size_t i = 0; i < vols_.size(); ++i) {
        const auto& vals = vols_[i].id().values();
        auto it = vals.find(field);
        if (it != vals.end() && iequals(it->second, value)) return static_cast<long>(i);
    }
    return -1;
}

//------------------------------- Controller -----------------------------------

grpc::Status MockProvider::CreateVolume(rpc::CallContext&, const csi::CreateVolumeRequest& req,
                                        csi::CreateVolumeResponse* resp) {
    if (req.name().empty()) {
        rpc::set_create_volume_error(resp, csi::Error::CreateVolumeError::INVALID_VOLUME_NAME, "missing name");
        return grpc::Status::OK;
    }

    std::lock_guard<std::mutex> lk(mu_);
    long idx = find("name", req.name());
    if (idx < 0) {
        std::uint64_t capacity = MOCK_DEFAULT_VOLUME_BYTES;
        if (req.has_capacity_range() && req.capacity_range().required_bytes() != 0) {
            capacity = req.capacity_range().required_bytes();
        }
        vols_.push_back(make_volume(req.name(), capacity));
        idx = static_cast<long>(vols_.size()) - 1;
    }
    *resp->mutable_result()->mutable_volume_info() = vols_[static_cast<std::size_t>(idx)];
    return grpc::Status::OK;
}

grpc::Status MockProvider::DeleteVolume(rpc::CallContext&, const csi::DeleteVolumeRequest& req,
                                        csi::DeleteVolumeResponse* resp) {
    const std::string* id = req.has_volume_id() ? id_value(req.volume_id()) : nullptr;
    if (!id) {
        rpc::set_delete_volume_error(resp, csi::Error::DeleteVolumeError::INVALID_VOLUME_ID, "missing id val");
        return grpc::Status::OK;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (long idx = find("id", *id); idx >= 0) {
        vols_.erase(vols_.begin() + idx);
    }
    resp->mutable_result();
    return grpc::Status::OK;
}

grpc::Status MockProvider::ControllerPublishVolume(rpc::CallContext&,
                                                   const csi::ControllerPublishVolumeRequest& req,
                                                   csi::ControllerPublishVolumeResponse* resp) {
    const std::string* id = req.has_volume_id() ? id_value(req.volume_id()) : nullptr;
    if (!id) {
        rpc::set_controller_publish_volume_error(resp, PublishErr::INVALID_VOLUME_ID, "missing id val");
        return grpc::Status::OK;
    }
    const std::string* node = req.has_node_id() ? id_value(req.node_id()) : nullptr;
    if (!node) {
        rpc::set_controller_publish_volume_error(resp, PublishErr::INVALID_NODE_ID, "node id required");
        return grpc::Status::OK;
    }
    const std::string attach_key = "devpath." + *node;

    std::lock_guard<std::mutex> lk(mu_);
    const long idx = find("id", *id);
    if (idx < 0) {
        rpc::set_controller_publish_volume_error(resp, PublishErr::VOLUME_DOES_NOT_EXIST, "missing volume");
        return grpc::Status::OK;
    }
    auto& meta = *vols_[static_cast<std::size_t>(idx)].mutable_metadata()->mutable_values();
    auto it = meta.find(attach_key);
    if (it == meta.end()) {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        it = meta.insert({attach_key, std::to_string(now)}).first;
    }
    (*resp->mutable_result()->mutable_publish_volume_info()->mutable_values())["devpath"] = it->second;
    return grpc::Status::OK;
}

grpc::Status MockProvider::ControllerUnpublishVolume(rpc::CallContext&,
                                                     const csi::ControllerUnpublishVolumeRequest& req,
                                                     csi::ControllerUnpublishVolumeResponse* resp) {
    const std::string* id = req.has_volume_id() ? id_value(req.volume_id()) : nullptr;
    if (!id) {
        rpc::set_controller_unpublish_volume_error(resp, UnpublishErr::INVALID_VOLUME_ID, "missing id val");
        return grpc::Status::OK;
    }
    const std::string* node = req.has_node_id() ? id_value(req.node_id()) : nullptr;
    if (!node) {
        rpc::set_controller_unpublish_volume_error(resp, UnpublishErr::INVALID_NODE_ID, "node id required");
        return grpc::Status::OK;
    }
    const std::string attach_key = "devpath." + *node;

    std::lock_guard<std::mutex> lk(mu_);
    const long idx = find("id", *id);
    if (idx < 0) {
        rpc::set_controller_unpublish_volume_error(resp, UnpublishErr::VOLUME_DOES_NOT_EXIST, "missing volume");
        return grpc::Status::OK;
    }
    auto& meta = *vols_[static_cast<std::size_t>(idx)].mutable_metadata()->mutable_values();
    if (meta.erase(attach_key) == 0) {
        rpc::set_controller_unpublish_volume_error(resp, UnpublishErr::VOLUME_NOT_ATTACHED_TO_SPECIFIED_NODE,
                                                   "not attached");
        return grpc::Status::OK;
    }
    resp->mutable_result();
    return grpc::Status::OK;
}

grpc::Status MockProvider::ValidateVolumeCapabilities(rpc::CallContext&,
                                                      const csi::ValidateVolumeCapabilitiesRequest& req,
                                                      csi::ValidateVolumeCapabilitiesResponse* resp) {
    const std::string* id = (req.has_volume_info() && req.volume_info().has_id())
                                ? id_value(req.volume_info().id()) : nullptr;
    std::lock_guard<std::mutex> lk(mu_);
    if (!id || find("id", *id) < 0) {
        auto* e = resp->mutable_error()->mutable_validate_volume_capabilities_error();
        e->set_error_code(csi::Error::ValidateVolumeCapabilitiesError::VOLUME_DOES_NOT_EXIST);
        e->set_error_description("missing volume");
        return grpc::Status::OK;
    }
    resp->mutable_result()->set_supported(true);
    return grpc::Status::OK;
}

grpc::Status MockProvider::ListVolumes(rpc::CallContext&, const csi::ListVolumesRequest& req,
                                       csi::ListVolumesResponse* resp) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto total = static_cast<std::uint32_t>(vols_.size());

    std::uint32_t start = 0;
    if (const auto& tok = req.starting_token(); !tok.empty()) {
        auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), start);
        if (ec != std::errc() || p != tok.data() + tok.size()) {
            rpc::set_general_error(resp, GeneralErr::UNKNOWN, "startingToken=" + tok + " is not a uint32");
            return grpc::Status::OK;
        }
    }
    if (start > total) {
        rpc::set_general_error(resp, GeneralErr::UNKNOWN,
                               "startingToken=" + std::to_string(start) + " > len(vols)=" + std::to_string(total));
        return grpc::Status::OK;
    }

    auto* result = resp->mutable_result();
    std::uint32_t n = 0;
    for (std::uint32_t i = start; i < total; ++i) {
        if (req.max_entries() > 0 && n >= req.max_entries()) break;
        *result->add_entries()->mutable_volume_info() = vols_[i];
        ++n;
    }
    if (start + n < total) result->set_next_token(std::to_string(start + n));
    return grpc::Status::OK;
}

grpc::Status MockProvider::GetCapacity(rpc::CallContext&, const csi::GetCapacityRequest&,
                                       csi::GetCapacityResponse* resp) {
    resp->mutable_result()->set_total_capacity(MOCK_TOTAL_CAPACITY_BYTES);
    return grpc::Status::OK;
}

grpc::Status MockProvider::ControllerGetCapabilities(rpc::CallContext&,
                                                     const csi::ControllerGetCapabilitiesRequest&,
                                                     csi::ControllerGetCapabilitiesResponse* resp) {
    using Rpc = csi::ControllerServiceCapability::RPC;
    auto* result = resp->mutable_result();
    for (auto t : {Rpc::CREATE_DELETE_VOLUME, Rpc::PUBLISH_UNPUBLISH_VOLUME, Rpc::LIST_VOLUMES, Rpc::GET_CAPACITY}) {
        result->add_capabilities()->mutable_rpc()->set_type(t);
    }
    return grpc::Status::OK;
}

//------------------------------- Identity -------------------------------------

grpc::Status MockProvider::GetSupportedVersions(rpc::CallContext&, const csi::GetSupportedVersionsRequest&,
                                                csi::GetSupportedVersionsResponse* resp) {
    auto* v = resp->mutable_result()->add_supported_versions();
    v->set_major(0);
    v->set_minor(1);
    v->set_patch(0);
    return grpc::Status::OK;
}

grpc::Status MockProvider::GetPluginInfo(rpc::CallContext&, const csi::GetPluginInfoRequest&,
                                         csi::GetPluginInfoResponse* resp) {
    auto* r = resp->mutable_result();
    r->set_name(name_);
    r->set_vendor_version(MOCK_VENDOR_VERSION);
    return grpc::Status::OK;
}

//------------------------------- Node -----------------------------------------

grpc::Status MockProvider::NodePublishVolume(rpc::CallContext&, const csi::NodePublishVolumeRequest& req,
                                             csi::NodePublishVolumeResponse* resp) {
    const std::string* id = req.has_volume_id() ? id_value(req.volume_id()) : nullptr;
    if (!id) {
        rpc::set_general_error(resp, GeneralErr::MISSING_REQUIRED_FIELD, "missing id val");
        return grpc::Status::OK;
    }

    std::lock_guard<std::mutex> lk(mu_);
    const long idx = find("id", *id);
    if (idx < 0) {
        auto* e = resp->mutable_error()->mutable_node_publish_volume_error();
        e->set_error_code(NodePubErr::VOLUME_DOES_NOT_EXIST);
        e->set_error_description("missing volume");
        return grpc::Status::OK;
    }
    if (req.target_path().empty()) {
        auto* e = resp->mutable_error()->mutable_node_publish_volume_error();
        e->set_error_code(NodePubErr::UNSUPPORTED_MOUNT_FLAGS);
        e->set_error_description("missing mount path");
        return grpc::Status::OK;
    }
    (*vols_[static_cast<std::size_t>(idx)].mutable_metadata()->mutable_values())[kMountPathKey] = req.target_path();
    resp->mutable_result();
    return grpc::Status::OK;
}

grpc::Status MockProvider::NodeUnpublishVolume(rpc::CallContext&, const csi::NodeUnpublishVolumeRequest& req,
                                               csi::NodeUnpublishVolumeResponse* resp) {
    const std::string* id = req.has_volume_id() ? id_value(req.volume_id()) : nullptr;

    std::lock_guard<std::mutex> lk(mu_);
    const long idx = id ? find("id", *id) : -1;
    if (idx < 0) {
        auto* e = resp->mutable_error()->mutable_node_unpublish_volume_error();
        e->set_error_code(NodeUnpubErr::VOLUME_DOES_NOT_EXIST);
        e->set_error_description(id ? "missing volume" : "missing id val");
        return grpc::Status::OK;
    }
    vols_[static_cast<std::size_t>(idx)].mutable_metadata()->mutable_values()->erase(kMountPathKey);
    resp->mutable_result();
    return grpc::Status::OK;
}

grpc::Status MockProvider::GetNodeID(rpc::CallContext&, const csi::GetNodeIDRequest&,
                                     csi::GetNodeIDResponse* resp) {
    (*resp->mutable_result()->mutable_node_id()->mutable_values())["id"] = MOCK_NODE_ID;
    return grpc::Status::OK;
}

grpc::Status MockProvider::ProbeNode(rpc::CallContext&, const csi::ProbeNodeRequest&,
                                     csi::ProbeNodeResponse* resp) {
    resp->mutable_result();
    return grpc::Status::OK;
}

grpc::Status MockProvider::NodeGetCapabilities(rpc::CallContext&, const csi::NodeGetCapabilitiesRequest&,
                                               csi::NodeGetCapabilitiesResponse* resp) {
    auto* mount = resp->mutable_result()->add_capabilities()->mutable_volume_capability()->mutable_mount();
    mount->set_fs_type("ext4");
    for (const char* flag : {"norootsquash", "uid=500", "gid=500"}) mount->add_mount_flags(flag);
    return grpc::Status::OK;
}

} // namespace csimux::providers
