/**
 * @file pipe_listener.cpp
 * @brief Rendezvous pairing for PipeListener.
 *
 * Both queues are guarded by one mutex and one condition variable. A waiter is
 * woken either because a counterpart filled its Rendezvous::outcome or because
 * the channel closed; an outcome set before close() still wins, so a paired
 * connection is never dropped.
 */
#include "csimux/transport/pipe_listener.hpp"
#include "csimux/config/constants.hpp"

#include <algorithm>

namespace csimux::transport {

PipeListener::PipeListener(std::string name) : name_(std::move(name)) {}

PipeListener::~PipeListener() { close(); }

Result<Conn> PipeListener::accept() {
    return rendezvous(accepts_, dials_, /*accepting=*/true);
}

Result<Conn> PipeListener::dial() {
    return rendezvous(dials_, accepts_, /*accepting=*/false);
}

Result<Conn> PipeListener::dial(const GiveUp& give_up) {
    return rendezvous(dials_, accepts_, /*accepting=*/false, &give_up);
}

Result<Conn> PipeListener::rendezvous(Queue& mine, Queue& theirs, bool accepting,
                                      const GiveUp* give_up) {
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_) {
        return make_error(ErrorCode::Closed, "pipe " + name_ + " closed");
    }

    if (!theirs.empty()) {
        auto peer = std::move(theirs.front());
        theirs.pop_front();

        auto ends = Conn::pair();
        if (!ends) {
            peer->outcome.emplace(csimux_detail::unexpected<Error>(ends.error()));
            cv_.notify_all();
            return csimux_detail::unexpected<Error>(ends.error());
        }
        // first end → acceptor, second end → dialer
        Conn& own   = accepting ? ends->first  : ends->second;
        Conn& other = accepting ? ends->second : ends->first;
        peer->outcome.emplace(std::move(other));
        cv_.notify_all();
        return std::move(own);
    }

    auto self = std::make_shared<Rendezvous>();
    mine.push_back(self);
    auto settled = [&] { return self->outcome.has_value() || closed_; };
    if (!give_up || !*give_up) {
        cv_.wait(lk, settled);
    } else {
        while (!cv_.wait_for(lk, config::constants::PIPE_DIAL_POLL_INTERVAL, settled)) {
            lk.unlock();
            auto reason = (*give_up)();
            lk.lock();
            if (reason && !settled()) {
                mine.erase(std::remove(mine.begin(), mine.end(), self), mine.end());
                return csimux_detail::unexpected<Error>(std::move(*reason));
            }
        }
    }
    if (self->outcome) {
        return std::move(*self->outcome);
    }
    return make_error(ErrorCode::Closed, "pipe " + name_ + " closed");
}

void PipeListener::close() noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    closed_ = true;
    accepts_.clear();
    dials_.clear();
    cv_.notify_all();
}

bool PipeListener::closed() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t PipeListener::pending_accepts() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return accepts_.size();
}

std::size_t PipeListener::pending_dials() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return dials_.size();
}

} // namespace csimux::transport
