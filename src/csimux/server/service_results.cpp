/**
 * @file service_results.cpp
 * @brief Blocking queue closed after the last Service stops.
 */
#include "csimux/server/service_results.hpp"

namespace csimux::server {

void ServiceResults::push(ServiceOutcome outcome) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    items_.push_back(std::move(outcome));
    cv_.notify_all();
}

void ServiceResults::close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_.notify_all();
}

std::optional<ServiceOutcome> ServiceResults::next() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    ServiceOutcome out = std::move(items_.front());
    items_.pop_front();
    return out;
}

std::vector<ServiceOutcome> ServiceResults::wait_all() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return closed_; });
    std::vector<ServiceOutcome> out(std::make_move_iterator(items_.begin()),
                                    std::make_move_iterator(items_.end()));
    items_.clear();
    return out;
}

bool ServiceResults::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

} // namespace csimux::server
