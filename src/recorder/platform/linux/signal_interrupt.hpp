#pragma once

#include "platform/interrupt_source.hpp"

// SIGINT/SIGTERM delivered through a signalfd. Construct before any thread is
// started so that every thread inherits the blocked mask.
class SignalInterrupt : public InterruptSource {
public:
    SignalInterrupt();
    ~SignalInterrupt() override;

    SignalInterrupt(const SignalInterrupt&) = delete;
    SignalInterrupt& operator=(const SignalInterrupt&) = delete;

    bool valid() const { return signal_fd_ >= 0; }
    bool wait(std::chrono::milliseconds timeout) override;

private:
    int signal_fd_ = -1;
};
