// TickLoop.cpp
#include "TickLoop.hpp"
#include "BlockTypes.hpp"
#include "Log.hpp"
#include <stdexcept>

namespace BlockFlow {

TickLoop::TickLoop(TickFn fn, double periodMs) : fn(std::move(fn)), period(periodMs) {
    if (!this->fn) throw std::invalid_argument("TickLoop requires a tick function");
    if (!(period > 0.0)) throw std::invalid_argument("TickLoop period must be positive");
}

bool TickLoop::start(bool systemEnabled, double nowMs) {
    if (current == State::Running) return false;
    if (!systemEnabled) {
        log::info("TickLoop", "not starting: system is disabled");
        return false;
    }
    current = State::Running;
    nextDue = nowMs; // first tick on the next pump
    log::info("TickLoop", "logic loop STARTED ({} ms period)", period);
    return true;
}

void TickLoop::stop() {
    if (current == State::Stopped) return;
    current = State::Stopped;
    log::info("TickLoop", "logic loop STOPPED");
}

void TickLoop::setEnabled(bool enabled, double nowMs) {
    if (enabled) start(true, nowMs);
    else stop();
}

bool TickLoop::pump(double nowMs) {
    if (current != State::Running || ticking) return false;
    if (nowMs < nextDue) return false;

    ticking = true;
    try {
        fn(nowMs);
    } catch (const InvariantViolation& e) {
        ticking = false;
        current = State::Stopped;
        log::error("TickLoop", "halting logic loop: {}", e.what());
        throw;
    } catch (...) {
        ticking = false;
        throw;
    }
    ticking = false;
    ++ticks;

    // No catch-up bursts after a stall: the next tick is one period from now.
    nextDue += period;
    if (nextDue <= nowMs) nextDue = nowMs + period;
    return true;
}

} // namespace BlockFlow
