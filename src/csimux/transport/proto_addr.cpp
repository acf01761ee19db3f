/**
 * @file proto_addr.cpp
 * @brief Endpoint parsing.
 */
#include "csimux/transport/proto_addr.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace csimux::transport {

static const std::regex& endpoint_rx() {
    static const std::regex rx(
        R"(^((?:(?:tcp|udp|ip)[46]?)|(?:unix(?:gram|packet)?))://(.+)$)",
        std::regex::ECMAScript | std::regex::icase);
    return rx;
}

Result<ProtoAddr> parse_proto_addr(std::string_view endpoint) {
    const std::string in(endpoint);
    std::smatch m;
    if (!std::regex_match(in, m, endpoint_rx())) {
        return make_error(ErrorCode::InvalidAddress, "invalid address: " + in);
    }
    ProtoAddr pa{m[1].str(), m[2].str()};
    std::transform(pa.network.begin(), pa.network.end(), pa.network.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return pa;
}

std::string format_proto_addr(const ProtoAddr& pa) {
    return pa.network + "://" + pa.address;
}

bool is_local_network(std::string_view network) noexcept {
    return network == "unix" || network == "unixgram" || network == "unixpacket";
}

Result<std::string> to_grpc_target(const ProtoAddr& pa) {
    if (pa.network == "tcp" || pa.network == "tcp4" || pa.network == "tcp6") {
        return pa.address;
    }
    if (pa.network == "unix") {
        return "unix:" + pa.address;
    }
    return make_error(ErrorCode::UnsupportedNetwork,
                      "network " + pa.network + " cannot carry gRPC");
}

} // namespace csimux::transport
