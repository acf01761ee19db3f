#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: routing/rejection/lifecycle events + counters.
 * @details The default sink prints one JSON-ish line per event to stderr.
 */

#include <string>
#include <cstdint>

namespace csimux::obs {

    /** @struct Counters
     *  @brief Process-level counters for routing and gating decisions.
     */
    struct Counters {
        uint64_t routed{0};           ///< Calls dispatched to a Service
        uint64_t routed_default{0};   ///< Calls that fell back to the first Service
        uint64_t rejected{0};         ///< Calls answered with a domain error by a Service
        uint64_t lifecycle{0};        ///< Lifecycle events (serve/stop/load/...)
    };

    /** @struct RouteEvent
     *  @brief A single routing decision made by the Routing Server.
     */
    struct RouteEvent {
        std::string method;        ///< Full gRPC method name
        std::string service_type;  ///< Provider type backing the Service
        std::string service_name;  ///< Service selected
        bool        defaulted{false}; ///< True when no tag matched and the first Service was used
    };

    /** @struct RejectEvent
     *  @brief A call answered with a domain error before reaching the provider.
     */
    struct RejectEvent {
        std::string service_name;  ///< Service that rejected the call
        std::string method;        ///< Short method name, e.g. "CreateVolume"
        std::string reason;        ///< Error description placed in the payload
    };

    /** @struct LifecycleEvent
     *  @brief State transition of a component (server, service, registry).
     */
    struct LifecycleEvent {
        std::string component;     ///< "server", "service", "registry", ...
        std::string name;          ///< Instance name (service name, module path)
        std::string action;        ///< "serve", "stop", "graceful_stop", "load", ...
        std::string detail;        ///< Optional free text
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a routing decision.
        virtual void record(const RouteEvent& e) = 0;
        /// Record a domain rejection.
        virtual void record(const RejectEvent& e) = 0;
        /// Record a lifecycle transition.
        virtual void record(const LifecycleEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    // Process-wide default sink (implemented in .cpp)
    Observer* make_simple_observer();

    /// `o` when non-null, else the process default sink.
    inline Observer* or_default(Observer* o) { return o ? o : make_simple_observer(); }

} // namespace csimux::obs
