#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <string>
#include <string_view>

PipeWireCapture::PipeWireCapture(DeviceInfo target, StreamFormat format,
                                 AudioBackend::DataCallback on_data,
                                 AudioBackend::ErrorCallback on_error)
    : target_(std::move(target)), format_(format),
      on_data_(std::move(on_data)), on_error_(std::move(on_error)) {}

PipeWireCapture::~PipeWireCapture() {
    stop();
}

namespace {

pw_properties* stream_properties(const DeviceInfo& target) {
    auto* props = pw_properties_new(PW_KEY_MEDIA_TYPE, "Audio",
                                    PW_KEY_MEDIA_CATEGORY, "Capture",
                                    PW_KEY_MEDIA_ROLE, "Production",
                                    PW_KEY_APP_NAME, "meeting-recorder",
                                    nullptr);
    pw_properties_set(props, PW_KEY_NODE_NAME,
                      target.monitor ? "meeting-recorder-system" : "meeting-recorder-mic");
    if (!target.name.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target.name.c_str());
    }
    if (target.monitor) {
        pw_properties_set(props, PW_KEY_STREAM_CAPTURE_SINK, "true");
    }
    return props;
}

// Interleaved F32; channel positions only for the layouts we can name.
const spa_pod* format_param(spa_pod_builder& builder, StreamFormat format) {
    spa_audio_info_raw raw{};
    raw.format = SPA_AUDIO_FORMAT_F32;
    raw.rate = format.sample_rate;
    raw.channels = format.channels;
    switch (format.channels) {
        case 1:
            raw.position[0] = SPA_AUDIO_CHANNEL_MONO;
            break;
        case 2:
            raw.position[0] = SPA_AUDIO_CHANNEL_FL;
            raw.position[1] = SPA_AUDIO_CHANNEL_FR;
            break;
        default:
            raw.flags = SPA_AUDIO_FLAG_UNPOSITIONED;
    }
    return spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &raw);
}

} // namespace

bool PipeWireCapture::start() {
    if (is_capturing()) return true;

    auto fail = [this](std::string_view what, int err) {
        std::println(stderr, "audio: {}: {}{}", target_.name, what,
                     err < 0 ? std::format(" ({})", spa_strerror(err)) : std::string());
        teardown();
        return false;
    };

    loop_ = pw_thread_loop_new(target_.monitor ? "mr-system" : "mr-mic", nullptr);
    if (!loop_) return fail("cannot create thread loop", 0);

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_),
                                   target_.monitor ? "system-audio" : "microphone",
                                   stream_properties(target_), &stream_events_, this);
    if (!stream_) return fail("cannot create stream", 0);

    uint8_t pod_buf[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buf, sizeof(pod_buf));
    const spa_pod* params[] = {format_param(builder, format_)};

    auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT |
                                              PW_STREAM_FLAG_MAP_BUFFERS |
                                              PW_STREAM_FLAG_RT_PROCESS);
    if (int err = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
        err < 0) {
        return fail("cannot connect stream", err);
    }
    if (int err = pw_thread_loop_start(loop_); err < 0) {
        return fail("cannot start thread loop", err);
    }

    capturing_.store(true, std::memory_order_release);
    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const float*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t samples = d->chunk->size / sizeof(float);

    if (self->capturing_.load(std::memory_order_relaxed) && samples > 0) {
        self->on_data_(std::span<const float>(data, samples));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (state == PW_STREAM_STATE_ERROR) {
        self->on_error_(std::format("{} -> {}: {}",
                                    pw_stream_state_as_string(old),
                                    pw_stream_state_as_string(state),
                                    error ? error : "unknown error"));
    }
}
