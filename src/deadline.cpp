#include "pdf_outline/deadline.h"
#include <utility>

namespace pdf_outline {

Deadline Deadline::start(Clock::duration budget) {
    return start(budget, [] { return Clock::now(); });
}

Deadline Deadline::start(Clock::duration budget, ClockFunction clock) {
    if (!clock) {
        clock = [] { return Clock::now(); };
    }
    auto now = clock();
    return Deadline(now, budget, std::move(clock));
}

Deadline::Deadline(Clock::time_point started, Clock::duration budget, ClockFunction clock)
    : started_(started),
      deadline_(started + (budget > Clock::duration::zero() ? budget : Clock::duration::zero())),
      budget_(budget),
      clock_(std::move(clock)) {}

Deadline::Clock::duration Deadline::remaining() const {
    return deadline_ - clock_();
}

bool Deadline::expired() const {
    return clock_() >= deadline_;
}

Deadline::Clock::duration Deadline::elapsed() const {
    return clock_() - started_;
}

} // namespace pdf_outline
