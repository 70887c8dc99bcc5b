/**
 * @file event_channel.cpp
 * @brief EventChannel implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/event_channel.hpp"

#include <exception>
#include <vector>

namespace sandbox_engine {

struct EventChannel::Subscription::State {
    mutable std::mutex mutex;
    std::map<SubscriptionId, std::shared_ptr<Handler>> handlers;
    SubscriptionId next_id = 1;

    bool remove(SubscriptionId id) {
        std::lock_guard lock(mutex);
        return handlers.erase(id) > 0;
    }
};

// ── Subscription ─────────────────────────────

EventChannel::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

EventChannel::Subscription& EventChannel::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void EventChannel::Subscription::reset() noexcept {
    if (id_ == 0) return;
    if (auto state = state_.lock()) state->remove(id_);
    state_.reset();
    id_ = 0;
}

// ── EventChannel ─────────────────────────────

EventChannel::EventChannel(Logger* logger)
    : state_(std::make_shared<Subscription::State>()), logger_(logger) {}

EventChannel::Subscription EventChannel::subscribe(Handler handler) {
    std::lock_guard lock(state_->mutex);
    SubscriptionId id = state_->next_id++;
    state_->handlers.emplace(id, std::make_shared<Handler>(std::move(handler)));
    return Subscription(state_, id);
}

bool EventChannel::unsubscribe(SubscriptionId id) {
    return state_->remove(id);
}

void EventChannel::publish(const ExecutionEvent& event) {
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard lock(state_->mutex);
        handlers.reserve(state_->handlers.size());
        for (const auto& [id, handler] : state_->handlers) handlers.push_back(handler);
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            if (!logger_) throw;
            logger_->warn("Event handler failed on " + std::string(to_string(event.type))
                          + " for " + event.id + ": " + e.what());
        }
    }
}

size_t EventChannel::subscriber_count() const {
    std::lock_guard lock(state_->mutex);
    return state_->handlers.size();
}

}  // namespace sandbox_engine
