#pragma once
// =============================================================================
// SingleFlight.hpp - At most one evaluation cycle in flight
// =============================================================================
// tryAcquire() hands out a Ticket when nothing is running; the slot is freed
// when the Ticket goes out of scope. A call that finds the slot taken gets an
// empty Ticket and is counted as dropped unless countDrop is false.
// Re-entrant calls from inside a running cycle (alert callbacks) land in the
// same bucket.
// =============================================================================

#include <atomic>
#include <cstdint>

namespace Scalp {

class SingleFlight {
public:
    class Ticket {
    public:
        Ticket() = default;
        explicit Ticket(std::atomic<bool>* slot) : slot_(slot) {}
        Ticket(Ticket&& other) noexcept : slot_(other.slot_) { other.slot_ = nullptr; }
        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                release();
                slot_ = other.slot_;
                other.slot_ = nullptr;
            }
            return *this;
        }
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        ~Ticket() { release(); }

        explicit operator bool() const { return slot_ != nullptr; }

        void release() {
            if (slot_) {
                slot_->store(false, std::memory_order_release);
                slot_ = nullptr;
            }
        }

    private:
        std::atomic<bool>* slot_ = nullptr;
    };

    Ticket tryAcquire(bool countDrop = true) {
        bool expected = false;
        if (inFlight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return Ticket(&inFlight_);
        }
        if (countDrop) dropped_.fetch_add(1, std::memory_order_relaxed);
        return Ticket();
    }

    bool busy() const { return inFlight_.load(std::memory_order_acquire); }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    void resetCounters() { dropped_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<bool> inFlight_{false};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace Scalp
