#pragma once

#include "errors.hpp"
#include "frame_sink.hpp"
#include "sample_queue.hpp"
#include "session_state.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>
#include <vector>

// Per-source metadata, fixed for the whole session.
struct SourceFormat {
    uint16_t channels = 1;
    uint32_t sample_rate = 48000;
};

enum class Source { Mic = 0, System = 1 };

namespace mix {

// Additive mix with hard clipping to the int16 range.
inline int16_t add_clamped(int16_t a, int16_t b) {
    int32_t sum = static_cast<int32_t>(a) + static_cast<int32_t>(b);
    return static_cast<int16_t>(std::clamp<int32_t>(sum,
                                                    std::numeric_limits<int16_t>::min(),
                                                    std::numeric_limits<int16_t>::max()));
}

// Appends src to dst as interleaved stereo. Mono samples are duplicated into
// L/R, stereo passes through, wider layouts keep their first two channels.
// A trailing partial frame is ignored.
void append_stereo(std::vector<int16_t>& dst, std::span<const int16_t> src, uint16_t channels);

} // namespace mix

struct MixerStats {
    std::array<uint64_t, 2> samples_received{};
    uint64_t frames_mixed = 0;
    uint64_t frames_passthrough = 0;
    uint64_t frames_flushed = 0;
    uint64_t output_bytes = 0;

    uint64_t frames_written() const { return frames_mixed + frames_passthrough + frames_flushed; }
};

// Drains both source queues, aligns them by buffer position and writes the
// combined stereo timeline to the sink. The mixer is the only writer of the sink.
class Mixer {
public:
    Mixer(SampleQueue& mic, SourceFormat mic_format,
          SampleQueue* system, SourceFormat system_format,
          FrameSink& sink, const SessionState& state,
          std::chrono::milliseconds idle_sleep = std::chrono::milliseconds(10));

    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    // Loops until a stop was requested, every producer queue is closed and a
    // drain after that returns nothing; then flushes and finalizes the sink.
    std::expected<MixerStats, RecorderError> run();

    // One drain, mix and starvation pass. Returns whether any samples arrived.
    std::expected<bool, RecorderError> step();

    // Mixes whatever overlaps, then writes the longer remainder against silence.
    std::expected<void, RecorderError> flush();

    size_t buffered(Source s) const { return buffers_[index(s)].size(); }
    const MixerStats& stats() const { return stats_; }

private:
    static size_t index(Source s) { return static_cast<size_t>(s); }

    bool producers_closed() const;
    void close_consumers();
    std::expected<void, RecorderError> write(int16_t left, int16_t right);
    std::expected<void, RecorderError> pass_through(std::vector<int16_t>& buf);

    std::array<SampleQueue*, 2> queues_;
    std::array<SourceFormat, 2> formats_;
    std::array<std::vector<int16_t>, 2> buffers_;
    std::vector<int16_t> scratch_;

    FrameSink& sink_;
    const SessionState& state_;
    std::chrono::milliseconds idle_sleep_;
    MixerStats stats_;
};
