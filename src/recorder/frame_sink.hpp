#pragma once

#include <cstdint>
#include <expected>
#include <string>

// Destination of the mixed stereo timeline. Open until finalize(), then closed for good.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual std::expected<void, std::string> write_frame(int16_t left, int16_t right) = 0;
    // Returns the final size of the artifact in bytes.
    virtual std::expected<uint64_t, std::string> finalize() = 0;
    virtual bool finalized() const = 0;
};
