/**
 * @file concurrency_governor.cpp
 * @brief ConcurrencyGovernor implementation.
 * @author Dimitris Kafetzis
 */

#include "governor/concurrency_governor.hpp"

namespace sandbox_engine {

ConcurrencyGovernor::ConcurrencyGovernor(size_t bound) : bound_(bound) {}

bool ConcurrencyGovernor::try_acquire() noexcept {
    size_t current = active_.load(std::memory_order_relaxed);
    do {
        if (current >= bound_) return false;
    } while (!active_.compare_exchange_weak(current, current + 1,
                                            std::memory_order_acq_rel,
                                            std::memory_order_relaxed));
    return true;
}

void ConcurrencyGovernor::release() noexcept {
    size_t current = active_.load(std::memory_order_relaxed);
    // Never underflow on an unmatched release
    while (current > 0 && !active_.compare_exchange_weak(current, current - 1,
                                                         std::memory_order_acq_rel,
                                                         std::memory_order_relaxed)) {
    }
}

ConcurrencyGovernor::Slot ConcurrencyGovernor::acquire_slot() noexcept {
    if (!try_acquire()) return Slot{};
    return Slot{this};
}

size_t ConcurrencyGovernor::active() const noexcept {
    return active_.load(std::memory_order_acquire);
}

}  // namespace sandbox_engine
