#pragma once

#include <chrono>
#include <functional>

namespace pdf_outline {

// Per-document time budget. Created once at pipeline start and passed by
// reference into every tier; it is never extended.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    // Starts a deadline `budget` from now on the steady clock
    static Deadline start(Clock::duration budget);

    // Same, reading time from `clock` (tests drive it by hand)
    static Deadline start(Clock::duration budget, ClockFunction clock);

    Clock::duration remaining() const;
    bool expired() const;

    Clock::duration elapsed() const;
    Clock::duration budget() const { return budget_; }

private:
    Deadline(Clock::time_point started, Clock::duration budget, ClockFunction clock);

    Clock::time_point started_;
    Clock::time_point deadline_;
    Clock::duration budget_;
    ClockFunction clock_;
};

} // namespace pdf_outline
