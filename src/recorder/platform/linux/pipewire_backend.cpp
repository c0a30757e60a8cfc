#include "platform/linux/pipewire_backend.hpp"

#include "platform/linux/pipewire_capture.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <format>
#include <pipewire/pipewire.h>
#include <spa/utils/result.h>

namespace {

// Registry globals arrive asynchronously; a core sync marks the end of the initial burst.
struct Enumeration {
    pw_thread_loop* loop = nullptr;
    pw_core* core = nullptr;
    uint32_t default_rate = 48000;
    int pending = 0;
    bool done = false;
    std::string error;
    std::vector<DeviceInfo> devices;
};

template <typename T>
T dict_number(const spa_dict* props, const char* key, T fallback) {
    const char* s = spa_dict_lookup(props, key);
    if (!s) return fallback;
    T v{};
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || v == 0) return fallback;
    return v;
}

void on_registry_global(void* data, uint32_t id, uint32_t /*permissions*/,
                        const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* e = static_cast<Enumeration*>(data);
    if (!type || !props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class) return;

    bool source = std::strcmp(media_class, "Audio/Source") == 0;
    bool sink = std::strcmp(media_class, "Audio/Sink") == 0;
    if (!source && !sink) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);
    if (!name) return;

    DeviceInfo info;
    info.id = id;
    info.name = name;
    info.description = desc ? desc : name;
    info.monitor = sink;
    if (sink) info.description = "Monitor of " + info.description;
    info.channels = dict_number<uint16_t>(props, "audio.channels", sink ? 2 : 1);
    info.sample_rate = dict_number<uint32_t>(props, "audio.rate", e->default_rate);
    e->devices.push_back(std::move(info));
}

void on_core_done(void* data, uint32_t id, int seq) {
    auto* e = static_cast<Enumeration*>(data);
    if (id == PW_ID_CORE && seq == e->pending) {
        e->done = true;
        pw_thread_loop_signal(e->loop, false);
    }
}

void on_core_error(void* data, uint32_t id, int /*seq*/, int res, const char* message) {
    auto* e = static_cast<Enumeration*>(data);
    if (id != PW_ID_CORE) return;
    e->error = std::format("{} ({})", message ? message : "core error", spa_strerror(res));
    pw_thread_loop_signal(e->loop, false);
}

const pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

const pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

constexpr int enumerate_timeout_s = 3;

} // namespace

PipeWireBackend::PipeWireBackend(uint32_t default_sample_rate)
    : default_sample_rate_(default_sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireBackend::~PipeWireBackend() {
    pw_deinit();
}

std::expected<std::vector<DeviceInfo>, std::string> PipeWireBackend::enumerate() {
    Enumeration e;
    e.default_rate = default_sample_rate_;

    e.loop = pw_thread_loop_new("meeting-recorder-devices", nullptr);
    if (!e.loop) {
        return std::unexpected("failed to create thread loop");
    }
    if (int ret = pw_thread_loop_start(e.loop); ret < 0) {
        pw_thread_loop_destroy(e.loop);
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    pw_thread_loop_lock(e.loop);

    pw_context* context = pw_context_new(pw_thread_loop_get_loop(e.loop), nullptr, 0);
    pw_registry* registry = nullptr;
    spa_hook core_listener{};
    spa_hook registry_listener{};
    std::string failure;

    if (!context) {
        failure = "failed to create PipeWire context";
    } else if (e.core = pw_context_connect(context, nullptr, 0); !e.core) {
        failure = "failed to connect to PipeWire";
    } else {
        pw_core_add_listener(e.core, &core_listener, &core_events, &e);
        registry = pw_core_get_registry(e.core, PW_VERSION_REGISTRY, 0);
        pw_registry_add_listener(registry, &registry_listener, &registry_events, &e);
        e.pending = pw_core_sync(e.core, PW_ID_CORE, 0);

        while (!e.done && e.error.empty()) {
            if (pw_thread_loop_timed_wait(e.loop, enumerate_timeout_s) != 0) {
                failure = "timed out waiting for the PipeWire registry";
                break;
            }
        }
        if (failure.empty() && !e.error.empty()) failure = e.error;
    }

    if (registry) {
        spa_hook_remove(&registry_listener);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry));
    }
    if (e.core) {
        spa_hook_remove(&core_listener);
        pw_core_disconnect(e.core);
    }
    if (context) pw_context_destroy(context);

    pw_thread_loop_unlock(e.loop);
    pw_thread_loop_stop(e.loop);
    pw_thread_loop_destroy(e.loop);

    if (!failure.empty()) return std::unexpected(failure);

    // Microphones first, then monitors, each in registry order
    std::ranges::stable_partition(e.devices, [](const DeviceInfo& d) { return !d.monitor; });
    return std::move(e.devices);
}

std::expected<std::unique_ptr<InputStream>, std::string>
PipeWireBackend::open_input(const DeviceInfo& device, StreamFormat format,
                            DataCallback on_data, ErrorCallback on_error) {
    if (format.channels == 0 || format.channels > SPA_AUDIO_MAX_CHANNELS) {
        return std::unexpected(std::format("unsupported channel count {}", format.channels));
    }
    if (format.sample_rate == 0) {
        return std::unexpected("unsupported sample rate 0");
    }
    return std::make_unique<PipeWireCapture>(device, format,
                                             std::move(on_data), std::move(on_error));
}
