#pragma once
/**
 * @file error.hpp
 * @brief Infrastructure error model shared by every csimux component.
 *
 * Two disjoint error classes exist in csimux:
 *  - Domain errors (malformed request, unsupported version) travel inside
 *    successful protocol responses as `csi.Error` payloads (see rpc/errors.hpp).
 *  - Infrastructure errors (bind/dial/load failures, lifecycle misuse) are
 *    reported with the types below, through csimux_detail::expected.
 */

#include <cstdint>
#include <string>
#include <utility>

#include "csimux/compat/expected.hpp"

namespace csimux {

/// Result codes for setup-time and lifecycle operations.
enum class ErrorCode : std::uint8_t {
    Closed = 1,          ///< Transport channel or listener already closed.
    EmptyServices,       ///< Server has no Services to route to.
    InvalidAddress,      ///< Listen/dial address does not parse as scheme://address.
    UnsupportedNetwork,  ///< Scheme parses but cannot carry a byte stream.
    ListenFailed,        ///< socket/bind/listen failed.
    AcceptFailed,        ///< accept failed with a non-recoverable error.
    IoFailed,            ///< read/write/socketpair on a connection failed.
    DialFailed,          ///< Could not establish a connection.
    ModuleLoadFailed,    ///< dlopen failed.
    ModuleSymbolMissing, ///< Module does not export the provider table.
    ModuleAbiMismatch,   ///< Provider table ABI version differs from ours.
    InvalidProvider,     ///< Empty name or null constructor.
    DuplicateProvider,   ///< Name already registered (case-insensitive).
    ProviderNotFound,    ///< No provider registered under the name.
    ServerStarted,       ///< Serve called twice.
    ServerStopped,       ///< Serve called after stop.
    InvalidConfig,       ///< Daemon configuration incomplete or malformed.
    Cancelled,           ///< Caller cancelled while waiting.
    DeadlineExceeded     ///< Caller's deadline passed while waiting.
};

/// Stable lowercase label for an ErrorCode.
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Infrastructure error: machine-checkable code + human message.
 */
struct Error final {
    ErrorCode   code{ErrorCode::InvalidConfig};
    std::string message;

    /// "code: message" rendering for logs and CLI output.
    [[nodiscard]] std::string describe() const;
};

/// Convenience for `csimux_detail::unexpected<Error>{Error{code, msg}}`.
inline csimux_detail::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return csimux_detail::unexpected<Error>(Error{code, std::move(message)});
}

/// Result alias used across the public API.
template <class T>
using Result = csimux_detail::expected<T, Error>;

} // namespace csimux
