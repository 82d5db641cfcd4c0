#pragma once

#include <cstdint>

namespace gridduel {

// Time source for search deadlines. Tests swap in ManualClock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now_ms() const = 0;
};

class SteadyClock : public Clock {
public:
    double now_ms() const override;
};

// Advances only when told to, optionally by a fixed step on every read.
class ManualClock : public Clock {
public:
    explicit ManualClock(double start_ms = 0.0, double step_ms = 0.0)
        : now_(start_ms), step_(step_ms) {}

    double now_ms() const override;
    void advance(double ms) { now_ += ms; }

private:
    mutable double now_;
    double step_;
};

const Clock& default_clock();

// Wall-clock budget measured against a Clock.
class Deadline {
public:
    Deadline(const Clock& clock, double budget_ms);

    double elapsed_ms() const;
    double budget_ms() const { return budget_ms_; }
    bool expired() const { return elapsed_ms() >= budget_ms_; }
    // True once `fraction` of the budget has been used.
    bool past(double fraction) const { return elapsed_ms() >= budget_ms_ * fraction; }

private:
    const Clock* clock_;
    double start_ms_;
    double budget_ms_;
};

// Throttled deadline check for hot loops: reads the clock every `interval` calls
// and latches once expired.
class NodeTimer {
public:
    NodeTimer(const Deadline& deadline, uint32_t interval)
        : deadline_(&deadline), mask_(interval ? interval - 1 : 0) {}

    bool time_up() {
        if (up_) return true;
        if ((++counter_ & mask_) != 0) return false;
        up_ = deadline_->expired();
        return up_;
    }

    bool expired_latched() const { return up_; }
    void reset() { counter_ = 0; up_ = false; }

private:
    const Deadline* deadline_;
    uint32_t mask_;
    uint32_t counter_ = 0;
    bool up_ = false;
};

} // namespace gridduel
