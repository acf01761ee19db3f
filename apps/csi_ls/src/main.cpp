/**
 * @file main.cpp
 * @brief csi_ls: list the volumes of one Service behind a csimux endpoint.
 *
 * Usage: [CSI_ENDPOINT=scheme://address] csi_ls [SERVICE] [VERSION]
 *
 * - SERVICE is sent as the `csi.service` routing tag; omitted means the default Service.
 * - VERSION is "major.minor.patch" (default 0.1.0).
 * - Prints one `VolumeID=<id>` line per volume, following next_token until exhausted.
 */

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "csimux/config/constants.hpp"
#include "csimux/rpc/client.hpp"
#include "csimux/rpc/errors.hpp"
#include "csimux/transport/proto_addr.hpp"

using namespace csimux;
namespace k = csimux::config::constants;

/// Parse "major.minor.patch".
static bool parse_version(std::string_view text, csi::Version* out) {
  std::uint32_t parts[3]{};
  const char* p   = text.data();
  const char* end = text.data() + text.size();
  for (int i = 0; i < 3; ++i) {
    auto [next, ec] = std::from_chars(p, end, parts[i]);
    if (ec != std::errc()) return false;
    p = next;
    if (i < 2) {
      if (p == end || *p != '.') return false;
      ++p;
    }
  }
  if (p != end) return false;
  out->set_major(parts[0]);
  out->set_minor(parts[1]);
  out->set_patch(parts[2]);
  return true;
}

int main(int argc, char** argv) {
  const char* env = std::getenv(k::ENDPOINT_ENV);
  const std::string endpoint = (env && *env) ? env : k::DEFAULT_CLIENT_ENDPOINT;

  auto pa = transport::parse_proto_addr(endpoint);
  if (!pa) {
    std::cerr << "csi_ls: " << pa.error().describe() << "\n";
    return 1;
  }
  auto target = transport::to_grpc_target(*pa);
  if (!target) {
    std::cerr << "csi_ls: " << target.error().describe() << "\n";
    return 1;
  }

  const std::string service = argc > 1 ? argv[1] : "";

  csi::ListVolumesRequest req;
  auto* version = req.mutable_version();
  version->set_major(k::CLIENT_DEFAULT_VERSION_MAJOR);
  version->set_minor(k::CLIENT_DEFAULT_VERSION_MINOR);
  version->set_patch(k::CLIENT_DEFAULT_VERSION_PATCH);
  if (argc > 2 && !parse_version(argv[2], version)) {
    std::cerr << "csi_ls: invalid version: " << argv[2] << "\n";
    return 1;
  }

  auto channel = grpc::CreateChannel(*target, grpc::InsecureChannelCredentials());
  if (!channel->WaitForConnected(std::chrono::system_clock::now() + k::CLIENT_CONNECT_TIMEOUT)) {
    std::cerr << "csi_ls: cannot connect to " << endpoint << "\n";
    return 1;
  }
  rpc::ProtocolClient client(channel);

  for (;;) {
    grpc::ClientContext ctx;
    if (!service.empty()) ctx.AddMetadata(k::ROUTING_METADATA_KEY, service);

    csi::ListVolumesResponse resp;
    auto st = client.call(ctx, req, &resp);
    if (!st.ok()) {
      std::cerr << "csi_ls: ListVolumes: " << st.error_message() << " (code " << st.error_code() << ")\n";
      return 1;
    }
    if (resp.has_error()) {
      std::cerr << "csi_ls: " << rpc::describe(resp.error()) << "\n";
      return 1;
    }

    for (const auto& entry : resp.result().entries()) {
      const auto& ids = entry.volume_info().id().values();
      auto it = ids.find("id");
      std::cout << "VolumeID=" << (it != ids.end() ? it->second : std::string{}) << "\n";
    }
    if (resp.result().next_token().empty()) break;
    req.set_starting_token(resp.result().next_token());
  }
  return 0;
}
