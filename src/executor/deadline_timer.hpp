/**
 * @file deadline_timer.hpp
 * @brief Races a wall-clock deadline against an external stop request.
 * @author Dimitris Kafetzis
 *
 * Whichever happens first (deadline elapse or stop request) invokes the
 * callback exactly once on the timer thread. Disarming before either one
 * prevents the callback; disarm() returns only after any in-flight
 * callback has finished, so the guarded resource can be released safely
 * right afterwards.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace sandbox_engine {

class DeadlineTimer {
public:
    enum class Reason : uint8_t { Deadline, StopRequested };
    using Callback = std::function<void(Reason)>;

    DeadlineTimer(Millis timeout, std::stop_token external, Callback on_fire);
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    /// Idempotent. After return the callback is neither running nor pending.
    void disarm();

    /// The reason the timer fired, if it did.
    [[nodiscard]] std::optional<Reason> fired() const;

private:
    void run(std::stop_token own, Millis timeout);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::stop_token external_;
    Callback on_fire_;
    std::optional<Reason> fired_;
    std::optional<std::stop_callback<std::function<void()>>> wake_on_stop_;
    std::jthread thread_;
};

}  // namespace sandbox_engine
