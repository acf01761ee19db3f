#pragma once
/**
 * @file signals.hpp
 * @brief Exit-signal trapping mapped onto the two shutdown modes.
 *
 * The first TERM/INT/HUP/QUIT requests a graceful shutdown; any exit signal that
 * arrives while that shutdown is still running escalates to a forced one.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>

namespace csimux::os {

/// How a running server is asked to terminate.
enum class ShutdownMode : std::uint8_t {
    Graceful = 0, ///< Stop accepting, drain in-flight calls, then clean up.
    Forced   = 1  ///< Cancel in-flight calls and clean up immediately.
};

/// Label for logs ("graceful" / "forced").
[[nodiscard]] const char* to_string(ShutdownMode m) noexcept;

/**
 * @brief Map a received signal to a shutdown mode.
 * @param signo     Signal number.
 * @param in_progress True when a graceful shutdown is already running.
 * @return Mode to apply, or std::nullopt for signals that are not exit requests.
 */
[[nodiscard]] std::optional<ShutdownMode> classify_signal(int signo, bool in_progress) noexcept;

/** @class SignalTrap
 *  @brief Blocks exit signals in the calling thread and handles them on a dedicated thread.
 *
 *  Construct before spawning other threads so they inherit the blocked mask.
 *  The graceful handler runs on its own worker so a second signal can still be
 *  received and escalated while it drains.
 */
class SignalTrap final {
public:
    using Handler = std::function<void(ShutdownMode, int signo)>;

    explicit SignalTrap(Handler handler);
    ~SignalTrap();

    SignalTrap(const SignalTrap&) = delete;
    SignalTrap& operator=(const SignalTrap&) = delete;

    /// True once any exit signal has been received.
    [[nodiscard]] bool triggered() const noexcept { return graceful_started_.load(std::memory_order_acquire); }

private:
    void run();

    Handler           handler_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> graceful_started_{false};
    std::thread       graceful_worker_;
    std::thread       waiter_;
};

} // namespace csimux::os
