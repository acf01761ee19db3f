#pragma once
/**
 * @file errors.hpp
 * @brief Builders for domain-error responses (`csi.Error` payloads).
 *
 * A domain error is returned with an OK gRPC status; only the payload's `error`
 * branch is set.
 */

#include <string>

#include "proto/csi.pb.h"

namespace csimux::rpc {

using GeneralErrorCode = csi::Error::GeneralError::GeneralErrorCode;

/// Fill resp->error().general_error().
template <class Response>
void set_general_error(Response* resp, GeneralErrorCode code, const std::string& description) {
    auto* ge = resp->mutable_error()->mutable_general_error();
    ge->set_error_code(code);
    ge->set_error_description(description);
}

void set_create_volume_error(csi::CreateVolumeResponse* resp,
                             csi::Error::CreateVolumeError::CreateVolumeErrorCode code,
                             const std::string& description);

void set_delete_volume_error(csi::DeleteVolumeResponse* resp,
                             csi::Error::DeleteVolumeError::DeleteVolumeErrorCode code,
                             const std::string& description);

void set_controller_publish_volume_error(
    csi::ControllerPublishVolumeResponse* resp,
    csi::Error::ControllerPublishVolumeError::ControllerPublishVolumeErrorCode code,
    const std::string& description);

void set_controller_unpublish_volume_error(
    csi::ControllerUnpublishVolumeResponse* resp,
    csi::Error::ControllerUnpublishVolumeError::ControllerUnpublishVolumeErrorCode code,
    const std::string& description);

/// "major.minor.patch"
[[nodiscard]] std::string format_version(const csi::Version& v);

/// Exact (major, minor, patch) equality.
[[nodiscard]] bool same_version(const csi::Version& a, const csi::Version& b) noexcept;

/// One-line rendering of any csi.Error for logs and CLI output.
[[nodiscard]] std::string describe(const csi::Error& err);

} // namespace csimux::rpc
