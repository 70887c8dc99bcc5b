/**
 * @file event_channel.hpp
 * @brief Typed publish/subscribe channel for execution lifecycle events.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sandbox_engine {

struct ExecutionEvent {
    enum class Type : uint8_t { Started, OutputChunk, Completed, Cancelled };

    Type type = Type::Started;
    ExecutionId id;
    std::string chunk;                  ///< OutputChunk only
    std::optional<Execution> snapshot;  ///< Completed / Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionEvent::Type type) noexcept {
    switch (type) {
        case ExecutionEvent::Type::Started:     return "started";
        case ExecutionEvent::Type::OutputChunk: return "output-chunk";
        case ExecutionEvent::Type::Completed:   return "completed";
        case ExecutionEvent::Type::Cancelled:   return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Fan-out of ExecutionEvents to registered handlers.
 *
 * Handlers run synchronously on the publishing thread (a worker thread for
 * output chunks) and must be quick. A handler removed while a publish is in
 * flight may still see that one event.
 */
class EventChannel {
public:
    using Handler = std::function<void(const ExecutionEvent&)>;
    using SubscriptionId = uint64_t;

    /**
     * @brief Unsubscribes on destruction. Safe to outlive the channel.
     */
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        [[nodiscard]] SubscriptionId id() const noexcept { return id_; }
        [[nodiscard]] bool active() const noexcept { return id_ != 0 && !state_.expired(); }
        void reset() noexcept;

    private:
        friend class EventChannel;
        struct State;
        Subscription(std::weak_ptr<State> state, SubscriptionId id) : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        SubscriptionId id_ = 0;
    };

    explicit EventChannel(Logger* logger = nullptr);

    [[nodiscard]] Subscription subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);

    void publish(const ExecutionEvent& event);

    [[nodiscard]] size_t subscriber_count() const;

private:
    std::shared_ptr<Subscription::State> state_;
    Logger* logger_;
};

}  // namespace sandbox_engine
