#include "engine/common/clock.hpp"

#include <chrono>

namespace gridduel {

double SteadyClock::now_ms() const {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

double ManualClock::now_ms() const {
    double t = now_;
    now_ += step_;
    return t;
}

const Clock& default_clock() {
    static const SteadyClock clock;
    return clock;
}

Deadline::Deadline(const Clock& clock, double budget_ms)
    : clock_(&clock), start_ms_(clock.now_ms()), budget_ms_(budget_ms) {}

double Deadline::elapsed_ms() const {
    return clock_->now_ms() - start_ms_;
}

} // namespace gridduel
