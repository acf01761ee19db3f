#pragma once
/**
 * @file service_results.hpp
 * @brief Completion stream of the Services started by a Server.
 *
 * Each Service pushes its terminal serve() result once. The stream is closed
 * after every Service has returned, so draining it is a barrier over all of them.
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "csimux/error.hpp"

namespace csimux::server {

/// Terminal result of one Service's serve loop.
struct ServiceOutcome {
    std::string  service;
    Result<void> result;
};

class ServiceResults final {
public:
    /// Producer side. Ignored after close().
    void push(ServiceOutcome outcome);

    /// Mark the stream complete and wake all readers. Idempotent.
    void close();

    /// Next outcome; blocks. nullopt once closed and drained.
    std::optional<ServiceOutcome> next();

    /// Block until closed; returns every outcome not yet consumed.
    std::vector<ServiceOutcome> wait_all();

    [[nodiscard]] bool closed() const;

private:
    mutable std::mutex         mu_;
    std::condition_variable    cv_;
    std::deque<ServiceOutcome> items_;
    bool                       closed_{false};
};

} // namespace csimux::server
