/**
 * @file errors.cpp
 * @brief Domain-error builders and helpers.
 */
#include "csimux/rpc/errors.hpp"

namespace csimux::rpc {

void set_create_volume_error(csi::CreateVolumeResponse* resp,
                             csi::Error::CreateVolumeError::CreateVolumeErrorCode code,
                             const std::string& description) {
    auto* e = resp->mutable_error()->mutable_create_volume_error();
    e->set_error_code(code);
    e->set_error_description(description);
}

void set_delete_volume_error(csi::DeleteVolumeResponse* resp,
                             csi::Error::DeleteVolumeError::DeleteVolumeErrorCode code,
                             const std::string& description) {
    auto* e = resp->mutable_error()->mutable_delete_volume_error();
    e->set_error_code(code);
    e->set_error_description(description);
}

void set_controller_publish_volume_error(
    csi::ControllerPublishVolumeResponse* resp,
    csi::Error::ControllerPublishVolumeError::ControllerPublishVolumeErrorCode code,
    const std::string& description) {
    auto* e = resp->mutable_error()->mutable_controller_publish_volume_error();
    e->set_error_code(code);
    e->set_error_description(description);
}

void set_controller_unpublish_volume_error(
    csi::ControllerUnpublishVolumeResponse* resp,
    csi::Error::ControllerUnpublishVolumeError::ControllerUnpublishVolumeErrorCode code,
    const std::string& description) {
    auto* e = resp->mutable_error()->mutable_controller_unpublish_volume_error();
    e->set_error_code(code);
    e->set_error_description(description);
}

std::string format_version(const csi::Version& v) {
    return std::to_string(v.major()) + "." + std::to_string(v.minor()) + "." +
           std::to_string(v.patch());
}

bool same_version(const csi::Version& a, const csi::Version& b) noexcept {
    return a.major() == b.major() && a.minor() == b.minor() && a.patch() == b.patch();
}

template <class Specific>
static std::string describe_specific(const char* kind, const Specific& e) {
    return std::string(kind) + ": " + std::to_string(static_cast<int>(e.error_code())) + ": " +
           e.error_description();
}

std::string describe(const csi::Error& err) {
    switch (err.value_case()) {
        case csi::Error::kGeneralError:
            return describe_specific("general_error", err.general_error());
        case csi::Error::kCreateVolumeError:
            return describe_specific("create_volume_error", err.create_volume_error());
        case csi::Error::kDeleteVolumeError:
            return describe_specific("delete_volume_error", err.delete_volume_error());
        case csi::Error::kControllerPublishVolumeError:
            return describe_specific("controller_publish_volume_error",
                                     err.controller_publish_volume_error());
        case csi::Error::kControllerUnpublishVolumeError:
            return describe_specific("controller_unpublish_volume_error",
                                     err.controller_unpublish_volume_error());
        case csi::Error::kValidateVolumeCapabilitiesError:
            return describe_specific("validate_volume_capabilities_error",
                                     err.validate_volume_capabilities_error());
        case csi::Error::kNodePublishVolumeError:
            return describe_specific("node_publish_volume_error", err.node_publish_volume_error());
        case csi::Error::kNodeUnpublishVolumeError:
            return describe_specific("node_unpublish_volume_error", err.node_unpublish_volume_error());
        case csi::Error::kProbeNodeError:
            return describe_specific("probe_node_error", err.probe_node_error());
        case csi::Error::kGetNodeIdError:
            return describe_specific("get_node_id_error", err.get_node_id_error());
        case csi::Error::VALUE_NOT_SET:
            break;
    }
    return "error: unset";
}

} // namespace csimux::rpc
