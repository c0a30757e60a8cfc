#pragma once

#include "config.hpp"
#include "device_manager.hpp"
#include "errors.hpp"
#include "frame_sink.hpp"
#include "mixer.hpp"
#include "platform/audio_backend.hpp"
#include "platform/interrupt_source.hpp"
#include "session_state.hpp"
#include "wav.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct RecordingResult {
    std::string path;
    uint64_t bytes = 0;
    uint64_t frames = 0;
};

// Runs one capture-mix-persist session: microphone plus optional system audio
// into a single stereo WAV file, until request_stop() or an interrupt.
class Recorder {
public:
    using SinkFactory = std::function<std::expected<std::unique_ptr<FrameSink>, std::string>(
        const std::string& path, const wav::Spec& spec)>;

    Recorder(AudioBackend& backend, Device mic, std::optional<Device> system,
             bool verbose = false);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Polled by record() while waiting for the stop signal. Not owned.
    void set_interrupt_source(InterruptSource* source) { interrupt_ = source; }
    void set_sink_factory(SinkFactory factory) { sink_factory_ = std::move(factory); }

    // Blocks until the session has stopped and the output is finalized.
    std::expected<RecordingResult, RecorderError> record(const Config& config);

    // Safe from any thread.
    void request_stop() { state_.request_stop(); }
    const SessionState& state() const { return state_; }

    // Output format for the configured sources: stereo, 16-bit, highest source rate.
    wav::Spec output_spec() const;

private:
    void wait_for_stop(const std::atomic<bool>& mixer_done);
    void log(const std::string& msg);

    AudioBackend& backend_;
    Device mic_;
    std::optional<Device> system_;
    bool verbose_;

    SessionState state_;
    InterruptSource* interrupt_ = nullptr;
    SinkFactory sink_factory_;

    static constexpr auto stop_poll_interval = std::chrono::milliseconds(100);
};
