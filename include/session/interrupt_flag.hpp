#pragma once

#include <atomic>

namespace ActivePref {
namespace Session {

/**
 * Cooperative interrupt request.
 *
 * The process-wide instance is set by the SIGINT handler; the session loop
 * polls it between phases. Only the first request counts, so repeated
 * Ctrl-C presses do not trigger repeated saves.
 */
class InterruptFlag {
public:
    constexpr InterruptFlag() : requested_(false) {}

    InterruptFlag(const InterruptFlag&) = delete;
    InterruptFlag& operator=(const InterruptFlag&) = delete;

    static InterruptFlag& instance();

    // True only for the call that actually raised the flag
    bool request() { return !requested_.exchange(true); }

    bool requested() const { return requested_.load(); }

    void reset() { requested_.store(false); }

    /**
     * Route SIGINT to the process-wide flag. Installed without SA_RESTART so
     * a read blocked on the terminal returns and the session can save.
     */
    static void install_signal_handler();
    static void restore_signal_handler();

private:
    std::atomic<bool> requested_;
};

} // namespace Session
} // namespace ActivePref
