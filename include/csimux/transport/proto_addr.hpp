#pragma once
/**
 * @file proto_addr.hpp
 * @brief Parsing of "scheme://address" endpoints.
 *
 * Accepted schemes (case-insensitive): tcp, tcp4, tcp6, udp, udp4, udp6, ip, ip4,
 * ip6, unix, unixgram, unixpacket. The scheme is normalized to lowercase.
 */

#include <string>
#include <string_view>

#include "csimux/error.hpp"

namespace csimux::transport {

/// Parsed endpoint.
struct ProtoAddr final {
    std::string network;  ///< Lowercase scheme, e.g. "tcp" or "unix"
    std::string address;  ///< Everything after "://"

    bool operator==(const ProtoAddr&) const = default;
};

/// Parse "scheme://address". Fails with ErrorCode::InvalidAddress.
Result<ProtoAddr> parse_proto_addr(std::string_view endpoint);

/// Render as "network://address".
[[nodiscard]] std::string format_proto_addr(const ProtoAddr& pa);

/// True for schemes that name a local (filesystem) socket.
[[nodiscard]] bool is_local_network(std::string_view network) noexcept;

/// Translate to a gRPC channel target ("host:port" or "unix:/path").
Result<std::string> to_grpc_target(const ProtoAddr& pa);

} // namespace csimux::transport
