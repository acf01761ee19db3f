/**
 * @file signals_posix.cpp
 * @brief sigtimedwait-based SignalTrap (Linux).
 */
#include "csimux/os/signals.hpp"
#include "csimux/config/constants.hpp"

#include <cerrno>
#include <csignal>
#include <ctime>
#include <pthread.h>

namespace csimux::os {

using csimux::config::constants::SIGNAL_WAIT_SLICE;

static sigset_t exit_signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGQUIT);
    return set;
}

const char* to_string(ShutdownMode m) noexcept {
    return m == ShutdownMode::Forced ? "forced" : "graceful";
}

std::optional<ShutdownMode> classify_signal(int signo, bool in_progress) noexcept {
    switch (signo) {
        case SIGINT: case SIGTERM: case SIGHUP: case SIGQUIT:
            return in_progress ? ShutdownMode::Forced : ShutdownMode::Graceful;
        default:
            return std::nullopt;
    }
}

SignalTrap::SignalTrap(Handler handler) : handler_(std::move(handler)) {
    const sigset_t set = exit_signal_set();
    ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    waiter_ = std::thread([this] { run(); });
}

SignalTrap::~SignalTrap() {
    stop_.store(true, std::memory_order_release);
    if (waiter_.joinable()) waiter_.join();
    if (graceful_worker_.joinable()) graceful_worker_.join();
}

void SignalTrap::run() {
    const sigset_t set = exit_signal_set();
    const auto slice_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(SIGNAL_WAIT_SLICE).count();
    timespec ts{};
    ts.tv_sec  = static_cast<time_t>(slice_ns / 1'000'000'000);
    ts.tv_nsec = static_cast<long>(slice_ns % 1'000'000'000);

    while (!stop_.load(std::memory_order_acquire)) {
        const int signo = ::sigtimedwait(&set, nullptr, &ts);
        if (signo < 0) continue; // EAGAIN (slice elapsed) or EINTR

        const auto mode = classify_signal(signo, graceful_started_.load(std::memory_order_acquire));
        if (!mode) continue;

        if (*mode == ShutdownMode::Graceful) {
            graceful_started_.store(true, std::memory_order_release);
            graceful_worker_ = std::thread([this, signo] { handler_(ShutdownMode::Graceful, signo); });
        } else {
            handler_(ShutdownMode::Forced, signo);
            return;
        }
    }
}

} // namespace csimux::os
