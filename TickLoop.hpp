// TickLoop.hpp
//
// Stopped/Running controller for the fixed-cadence logic pass. The host drives
// it cooperatively by calling pump() with the current time; a due tick runs
// to completion before the next one can be scheduled.
#pragma once
#include <functional>

namespace BlockFlow {

class TickLoop {
public:
    enum class State { Stopped, Running };

    using TickFn = std::function<void(double nowMs)>;

    static constexpr double kDefaultPeriodMs = 10.0;

    explicit TickLoop(TickFn fn, double periodMs = kDefaultPeriodMs);

    // Starts only when the system is enabled; no-op while Running.
    bool start(bool systemEnabled, double nowMs);
    // No-op while Stopped. An in-flight tick finishes; no new one is scheduled.
    void stop();
    // Follows the global enable flag: enabled -> start, disabled -> stop.
    void setEnabled(bool enabled, double nowMs);

    // Fires at most one due tick. Returns true when a tick ran.
    bool pump(double nowMs);

    State state() const { return current; }
    bool isRunning() const { return current == State::Running; }
    bool inTick() const { return ticking; }
    double periodMs() const { return period; }
    double nextDueMs() const { return nextDue; }
    unsigned long long tickCount() const { return ticks; }

private:
    TickFn fn;
    double period;
    State current = State::Stopped;
    bool ticking = false;
    double nextDue = 0.0;
    unsigned long long ticks = 0;
};

} // namespace BlockFlow
