#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the server, transport and registry.
 * @details These values eliminate magic strings/numbers from the codebase. The daemon
 *          overrides the endpoint through the environment (see config_loader.hpp).
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace csimux::config::constants {

// =====================
// Routing
// =====================
/// Call-metadata key selecting the target Service by name (case-insensitive).
/// gRPC metadata keys are lowercase on the wire.
inline constexpr const char* ROUTING_METADATA_KEY = "csi.service";

// =====================
// Endpoints
// =====================
/// Environment variable carrying the scheme://address endpoint.
inline constexpr const char* ENDPOINT_ENV = "CSI_ENDPOINT";
/// Endpoint used by client tools when ENDPOINT_ENV is unset.
inline constexpr const char* DEFAULT_CLIENT_ENDPOINT = "tcp://127.0.0.1:8080";
/// Separator between TYPE and NAME in a service definition (TYPE[:NAME]).
inline constexpr char SERVICE_DEF_SEPARATOR = ':';

// =====================
// Socket listener
// =====================
inline constexpr int LISTEN_BACKLOG = 128;               ///< listen(2) backlog
inline constexpr int ACCEPT_POLL_TIMEOUT_MS = -1;        ///< poll(2) timeout; -1 blocks until woken

/// How often a parked PipeListener::dial re-checks whether its caller gave up.
inline constexpr std::chrono::milliseconds PIPE_DIAL_POLL_INTERVAL{10};

// =====================
// Signals
// =====================
/// sigtimedwait(2) slice; bounds how long SignalTrap takes to notice its own shutdown.
inline constexpr std::chrono::milliseconds SIGNAL_WAIT_SLICE{200};

// =====================
// Provider modules
// =====================
/// Exported symbol every provider module must define (extern "C").
inline constexpr const char* PROVIDER_TABLE_SYMBOL = "csimux_service_providers";
/// ABI version of csimux_provider_table. Bump on any layout/semantic change.
inline constexpr std::uint32_t PROVIDER_ABI_VERSION = 1;

// =====================
// RPC
// =====================
/// Default version a client tool declares when none is given.
inline constexpr std::uint32_t CLIENT_DEFAULT_VERSION_MAJOR = 0;
inline constexpr std::uint32_t CLIENT_DEFAULT_VERSION_MINOR = 1;
inline constexpr std::uint32_t CLIENT_DEFAULT_VERSION_PATCH = 0;
/// How long client tools wait for the channel to become ready.
inline constexpr std::chrono::seconds CLIENT_CONNECT_TIMEOUT{5};

// =====================
// Mock provider
// =====================
inline constexpr const char*   MOCK_PROVIDER_NAME = "mock";
inline constexpr const char*   MOCK_VENDOR_VERSION = "0.1.0";
inline constexpr const char*   MOCK_NODE_ID = "mock";
inline constexpr std::uint64_t GIB = 1024ull * 1024ull * 1024ull;
inline constexpr std::uint64_t MOCK_DEFAULT_VOLUME_BYTES = 100 * GIB;          ///< Size when no capacity is requested
inline constexpr std::uint64_t MOCK_TOTAL_CAPACITY_BYTES = 100 * 1024 * GIB;   ///< Reported by GetCapacity
inline constexpr std::size_t   MOCK_SEED_VOLUMES = 3;                           ///< "Mock Volume 1".."Mock Volume N"

} // namespace csimux::config::constants
