/**
 * @file deadline_timer.cpp
 * @brief DeadlineTimer implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/deadline_timer.hpp"

namespace sandbox_engine {

DeadlineTimer::DeadlineTimer(Millis timeout, std::stop_token external, Callback on_fire)
    : external_(std::move(external))
    , on_fire_(std::move(on_fire)) {
    wake_on_stop_.emplace(external_, std::function<void()>([this] {
        std::lock_guard lock(mutex_);
        cv_.notify_all();
    }));
    thread_ = std::jthread([this, timeout](std::stop_token own) { run(own, timeout); });
}

DeadlineTimer::~DeadlineTimer() {
    disarm();
}

void DeadlineTimer::disarm() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    wake_on_stop_.reset();
}

std::optional<DeadlineTimer::Reason> DeadlineTimer::fired() const {
    std::lock_guard lock(mutex_);
    return fired_;
}

void DeadlineTimer::run(std::stop_token own, Millis timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    Reason reason;
    {
        std::unique_lock lock(mutex_);
        bool externally_stopped = cv_.wait_until(lock, own, deadline,
            [this] { return external_.stop_requested(); });

        if (own.stop_requested()) return;  // disarmed
        reason = externally_stopped ? Reason::StopRequested : Reason::Deadline;
        fired_ = reason;
    }
    if (on_fire_) on_fire_(reason);
}

}  // namespace sandbox_engine
