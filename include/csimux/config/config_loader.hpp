#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: build the daemon configuration from argv and the environment.
 * @details Names and defaults come from constants.hpp.
 */

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "csimux/error.hpp"

namespace csimux::config {

    /** @struct ServiceDef
     *  @brief One TYPE[:NAME] service definition.
     */
    struct ServiceDef {
        std::string type;  ///< Provider name to construct
        std::string name;  ///< Service (routing) name; equals type when omitted

        bool operator==(const ServiceDef&) const = default;
    };

    /** @struct DaemonConfig
     *  @brief Everything the daemon needs to start.
     */
    struct DaemonConfig {
        std::string              endpoint;      ///< scheme://address to listen on
        std::vector<std::string> module_paths;  ///< Provider modules, in load order
        std::vector<ServiceDef>  services;      ///< Services, in routing order
    };

    /** @class Loader
     *  @brief Source of daemon configuration.
     */
    class Loader {
    public:
        /// Environment lookup; returns nullopt for unset variables.
        using Env = std::function<std::optional<std::string>(const char*)>;
        /// Filesystem probe deciding whether an argument names a module file.
        using FileProbe = std::function<bool(const std::string&)>;

        /**
         * @brief Parse daemon arguments.
         * @param args  Arguments without the program name. Arguments naming existing
         *              files are module paths; the rest are TYPE[:NAME] definitions.
         * @param env   Environment lookup (CSI_ENDPOINT is required).
         * @param probe File-existence check; defaults to the real filesystem.
         * @return DaemonConfig, or InvalidConfig describing what is missing.
         */
        static Result<DaemonConfig> from_args(std::span<const std::string> args, const Env& env,
                                              const FileProbe& probe = {});

        /// Process environment.
        static Env process_env();

        /// Parse one TYPE[:NAME] definition. Fails with InvalidConfig on an empty type.
        static Result<ServiceDef> parse_service_def(std::string_view def);
    };

} // namespace csimux::config
