/**
 * @file error.cpp
 * @brief ErrorCode labels.
 */
#include "csimux/error.hpp"

namespace csimux {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Closed:              return "closed";
        case ErrorCode::EmptyServices:       return "empty_services";
        case ErrorCode::InvalidAddress:      return "invalid_address";
        case ErrorCode::UnsupportedNetwork:  return "unsupported_network";
        case ErrorCode::ListenFailed:        return "listen_failed";
        case ErrorCode::AcceptFailed:        return "accept_failed";
        case ErrorCode::IoFailed:            return "io_failed";
        case ErrorCode::DialFailed:          return "dial_failed";
        case ErrorCode::ModuleLoadFailed:    return "module_load_failed";
        case ErrorCode::ModuleSymbolMissing: return "module_symbol_missing";
        case ErrorCode::ModuleAbiMismatch:   return "module_abi_mismatch";
        case ErrorCode::InvalidProvider:     return "invalid_provider";
        case ErrorCode::DuplicateProvider:   return "duplicate_provider";
        case ErrorCode::ProviderNotFound:    return "provider_not_found";
        case ErrorCode::ServerStarted:       return "server_started";
        case ErrorCode::ServerStopped:       return "server_stopped";
        case ErrorCode::InvalidConfig:       return "invalid_config";
        case ErrorCode::Cancelled:           return "cancelled";
        case ErrorCode::DeadlineExceeded:    return "deadline_exceeded";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::string out = to_string(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace csimux
