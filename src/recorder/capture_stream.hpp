#pragma once

#include "platform/audio_backend.hpp"
#include "sample_queue.hpp"
#include "session_state.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <vector>

// Float sample in [-1, 1] to int16, clamping out-of-range input. NaN maps to 0.
inline int16_t to_int16(float s) {
    if (std::isnan(s)) return 0;
    return static_cast<int16_t>(std::clamp(s, -1.0f, 1.0f) *
                                std::numeric_limits<int16_t>::max());
}

// One hardware source feeding one SampleQueue. The data callback converts and
// enqueues without blocking; nothing is enqueued once the session has stopped.
class CaptureStream {
public:
    static std::expected<std::unique_ptr<CaptureStream>, std::string>
        open(AudioBackend& backend, const DeviceInfo& device, StreamFormat format,
             SampleQueue& queue, const SessionState& state, std::string label);

    ~CaptureStream();

    CaptureStream(const CaptureStream&) = delete;
    CaptureStream& operator=(const CaptureStream&) = delete;

    bool start();
    // Stops the hardware stream and closes the producer side of the queue.
    void close();

    const std::string& label() const { return label_; }
    StreamFormat format() const { return format_; }
    uint64_t blocks_sent() const { return blocks_sent_.load(std::memory_order_relaxed); }
    uint64_t stream_errors() const { return stream_errors_.load(std::memory_order_relaxed); }

private:
    struct Token {};

public:
    CaptureStream(Token, SampleQueue& queue, const SessionState& state,
                  StreamFormat format, std::string label);

private:

    void on_data(std::span<const float> data);
    void on_error(const std::string& message);

    // Largest block converted in one go; bigger callbacks are split on frame boundaries.
    static constexpr size_t max_block_samples = 16384;

    SampleQueue& queue_;
    const SessionState& state_;
    StreamFormat format_;
    std::string label_;
    std::vector<int16_t> scratch_;
    std::unique_ptr<InputStream> stream_;
    bool closed_ = false;

    std::atomic<uint64_t> blocks_sent_{0};
    std::atomic<uint64_t> stream_errors_{0};
};
