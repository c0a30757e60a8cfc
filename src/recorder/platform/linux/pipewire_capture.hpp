#pragma once

#include "platform/audio_backend.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Captures interleaved F32 from one PipeWire node. Monitors of sinks are
// captured through stream.capture.sink.
class PipeWireCapture : public InputStream {
public:
    PipeWireCapture(DeviceInfo target, StreamFormat format,
                    AudioBackend::DataCallback on_data,
                    AudioBackend::ErrorCallback on_error);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    DeviceInfo target_;
    StreamFormat format_;
    AudioBackend::DataCallback on_data_;
    AudioBackend::ErrorCallback on_error_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
