#pragma once
/**
 * @file pipe_listener.hpp
 * @brief In-process rendezvous transport: a listener that is also a dialer.
 *
 * Concurrency model:
 *   • accept() parks until a dial() arrives; dial() parks until an accept() is waiting.
 *   • Pairing is FIFO on both sides: the Nth accept pairs with the Nth dial.
 *   • Each pairing yields a fresh connected AF_UNIX socketpair; the acceptor
 *     receives one end, the dialer the other. No network stack is involved and
 *     no port or filesystem path is consumed.
 *   • close() fails every parked request with ErrorCode::Closed; later calls
 *     fail immediately without blocking.
 *   • A dial() given a GiveUp check leaves the queue as soon as the check
 *     returns an error; a pairing that already happened still wins.
 *
 * Thread-safety: all members may be called concurrently from any thread.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "csimux/transport/listener.hpp"

namespace csimux::transport {

class PipeListener final : public Listener {
public:
    /// @param name Label reported by address(); used as the gRPC authority by dialers.
    explicit PipeListener(std::string name);
    ~PipeListener() override;

    PipeListener(const PipeListener&) = delete;
    PipeListener& operator=(const PipeListener&) = delete;

    Result<Conn> accept() override;

    /// Returns the reason to abandon a parked dial, or nullopt to keep waiting.
    using GiveUp = std::function<std::optional<Error>()>;

    /// Client side of the rendezvous.
    Result<Conn> dial();

    /// Client side of the rendezvous; `give_up` is polled while parked.
    Result<Conn> dial(const GiveUp& give_up);

    void close() noexcept override;

    [[nodiscard]] bool closed() const noexcept;

    [[nodiscard]] std::string network() const override { return "pipe"; }
    [[nodiscard]] std::string address() const override { return name_; }

    /// Requests currently parked waiting for a counterpart.
    [[nodiscard]] std::size_t pending_accepts() const noexcept;
    [[nodiscard]] std::size_t pending_dials() const noexcept;

private:
    /// One parked accept or dial. Filled in by the counterpart that pairs with it.
    struct Rendezvous {
        std::optional<Result<Conn>> outcome;
    };
    using Queue = std::deque<std::shared_ptr<Rendezvous>>;

    /// Shared body of accept()/dial(): pair with the oldest waiter in `theirs`
    /// or park in `mine` until paired or closed.
    Result<Conn> rendezvous(Queue& mine, Queue& theirs, bool accepting,
                            const GiveUp* give_up = nullptr);

    const std::string        name_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    Queue                    accepts_;
    Queue                    dials_;
    bool                     closed_{false};
};

} // namespace csimux::transport
