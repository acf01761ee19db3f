/**
 * @file config_loader.cpp
 * @brief argv/environment loader for the daemon.
 */
#include "csimux/config/config_loader.hpp"
#include "csimux/config/constants.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace csimux::config {
    using namespace csimux::config::constants;

    static bool file_exists(const std::string& path) {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

    Loader::Env Loader::process_env() {
        return [](const char* key) -> std::optional<std::string> {
            const char* v = std::getenv(key);
            if (!v) return std::nullopt;
            return std::string(v);
        };
    }

    Result<ServiceDef> Loader::parse_service_def(std::string_view def) {
        ServiceDef out;
        const auto sep = def.find(SERVICE_DEF_SEPARATOR);
        if (sep == std::string_view::npos) {
            out.type = std::string(def);
            out.name = out.type;
        } else {
            out.type = std::string(def.substr(0, sep));
            out.name = std::string(def.substr(sep + 1));
            if (out.name.empty()) out.name = out.type;
        }
        if (out.type.empty()) {
            return make_error(ErrorCode::InvalidConfig, "service definition '" + std::string(def) + "' has no type");
        }
        return out;
    }

    Result<DaemonConfig> Loader::from_args(std::span<const std::string> args, const Env& env,
                                           const FileProbe& probe) {
        const FileProbe& exists = probe ? probe : FileProbe(&file_exists);
        DaemonConfig cfg;

        for (const auto& arg : args) {
            if (exists(arg)) {
                cfg.module_paths.push_back(arg);
                continue;
            }
            auto def = parse_service_def(arg);
            if (!def) return csimux_detail::unexpected<Error>(def.error());
            cfg.services.push_back(std::move(*def));
        }

        if (cfg.services.empty()) {
            return make_error(ErrorCode::InvalidConfig, "no service definitions (TYPE[:NAME])");
        }

        auto endpoint = env ? env(ENDPOINT_ENV) : std::nullopt;
        if (!endpoint || endpoint->empty()) {
            return make_error(ErrorCode::InvalidConfig, std::string("missing ") + ENDPOINT_ENV);
        }
        cfg.endpoint = std::move(*endpoint);
        return cfg;
    }

} // namespace csimux::config
