/**
 * @file concurrency_governor.hpp
 * @brief Bounds the number of simultaneously running executions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <cstddef>

namespace sandbox_engine {

/**
 * @brief Lock-free counting gate. Submissions beyond the bound fail fast.
 */
class ConcurrencyGovernor {
public:
    /**
     * @brief Move-only ownership of one slot; releases on destruction.
     *
     * Held by the dispatched backend call so the slot is returned on every
     * exit path, including exceptions.
     */
    class Slot {
    public:
        Slot() = default;
        explicit Slot(ConcurrencyGovernor* owner) noexcept : owner_(owner) {}
        ~Slot() { reset(); }

        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                reset();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }

        void reset() noexcept {
            if (owner_) {
                owner_->release();
                owner_ = nullptr;
            }
        }

    private:
        ConcurrencyGovernor* owner_ = nullptr;
    };

    explicit ConcurrencyGovernor(size_t bound);

    ConcurrencyGovernor(const ConcurrencyGovernor&) = delete;
    ConcurrencyGovernor& operator=(const ConcurrencyGovernor&) = delete;

    /// Take a slot if one is free.
    [[nodiscard]] bool try_acquire() noexcept;

    /// Return a slot taken by try_acquire().
    void release() noexcept;

    /// try_acquire() wrapped in a Slot; empty Slot when saturated.
    [[nodiscard]] Slot acquire_slot() noexcept;

    [[nodiscard]] size_t active() const noexcept;
    [[nodiscard]] size_t bound() const noexcept { return bound_; }

private:
    const size_t bound_;
    std::atomic<size_t> active_{0};
};

}  // namespace sandbox_engine
