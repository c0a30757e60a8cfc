#pragma once

#include <atomic>

enum class SessionPhase { Running, StopRequested, Stopped };

// Run/stop flag shared by the capture callbacks, the mixer and the controller.
// Each recording owns its own instance; components hold it by reference.
class SessionState {
public:
    SessionState() = default;

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    bool running() const {
        return phase_.load(std::memory_order_acquire) == SessionPhase::Running;
    }

    SessionPhase phase() const { return phase_.load(std::memory_order_acquire); }

    // Safe from any thread. Only the first call has an effect.
    bool request_stop() {
        auto expected = SessionPhase::Running;
        return phase_.compare_exchange_strong(expected, SessionPhase::StopRequested,
                                              std::memory_order_acq_rel);
    }

    // Controller only, after the mixer has been joined.
    void mark_stopped() {
        request_stop();
        phase_.store(SessionPhase::Stopped, std::memory_order_release);
    }

private:
    std::atomic<SessionPhase> phase_{SessionPhase::Running};
    static_assert(std::atomic<SessionPhase>::is_always_lock_free);
};
