#pragma once

#include <chrono>

// External stop trigger (e.g. SIGINT) polled by the recording controller.
class InterruptSource {
public:
    virtual ~InterruptSource() = default;
    // Waits up to timeout. Returns true if an interrupt arrived.
    virtual bool wait(std::chrono::milliseconds timeout) = 0;
};
