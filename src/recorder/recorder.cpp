#include "recorder.hpp"

#include "capture_stream.hpp"
#include "recording_name.hpp"
#include "wav_writer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <format>
#include <print>
#include <thread>

Recorder::Recorder(AudioBackend& backend, Device mic, std::optional<Device> system, bool verbose)
    : backend_(backend), mic_(std::move(mic)), system_(std::move(system)), verbose_(verbose),
      sink_factory_([](const std::string& path, const wav::Spec& spec)
                        -> std::expected<std::unique_ptr<FrameSink>, std::string> {
          auto w = WavWriter::create(path, spec);
          if (!w) return std::unexpected(w.error());
          return std::unique_ptr<FrameSink>(std::move(*w));
      }) {}

Recorder::~Recorder() = default;

wav::Spec Recorder::output_spec() const {
    wav::Spec spec;
    spec.channels = 2;
    spec.bits_per_sample = 16;
    spec.sample_rate = mic_.info().sample_rate;
    if (system_) {
        spec.sample_rate = std::max(spec.sample_rate, system_->info().sample_rate);
    }
    return spec;
}

std::expected<RecordingResult, RecorderError> Recorder::record(const Config& config) {
    using Kind = RecorderError::Kind;

    if (state_.phase() == SessionPhase::Stopped) {
        return std::unexpected(RecorderError{Kind::Coordination, "session already finished"});
    }

    std::error_code ec;
    if (config.output_directory.empty() ||
        !std::filesystem::is_directory(config.output_directory, ec)) {
        return std::unexpected(RecorderError{
            Kind::Config, std::format("output directory '{}' is not usable",
                                      config.output_directory)});
    }

    auto path = config.recording_path(recording_filename(std::chrono::system_clock::now()));
    auto spec = output_spec();

    auto mic_format = mic_.default_format();
    SampleQueue mic_queue(config.audio.queue_capacity(mic_format.channels, mic_format.sample_rate));

    std::optional<SampleQueue> sys_queue;
    StreamFormat sys_format;
    if (system_) {
        sys_format = system_->default_format();
        sys_queue.emplace(config.audio.queue_capacity(sys_format.channels, sys_format.sample_rate));
        if (sys_format.sample_rate != mic_format.sample_rate) {
            std::println(stderr, "[meeting-recorder] warning: source rates differ ({} Hz vs {} Hz), "
                         "sources are mixed without resampling",
                         mic_format.sample_rate, sys_format.sample_rate);
        }
    }

    // Devices are opened before anything touches the filesystem.
    auto mic_stream = CaptureStream::open(backend_, mic_.info(), mic_format,
                                          mic_queue, state_, "microphone");
    if (!mic_stream) {
        return std::unexpected(RecorderError{Kind::Device, mic_stream.error()});
    }

    std::unique_ptr<CaptureStream> sys_stream;
    if (system_) {
        auto s = CaptureStream::open(backend_, system_->info(), sys_format,
                                     *sys_queue, state_, "system audio");
        if (!s) {
            return std::unexpected(RecorderError{Kind::Device, s.error()});
        }
        sys_stream = std::move(*s);
    }

    auto sink = sink_factory_(path, spec);
    if (!sink) {
        return std::unexpected(RecorderError{Kind::SinkOpen, sink.error()});
    }

    Mixer mixer(mic_queue, {mic_format.channels, mic_format.sample_rate},
                sys_queue ? &*sys_queue : nullptr, {sys_format.channels, sys_format.sample_rate},
                **sink, state_);

    std::optional<std::expected<MixerStats, RecorderError>> mixer_result;
    std::atomic<bool> mixer_done{false};

    std::jthread mixer_thread([&] {
        try {
            mixer_result = mixer.run();
        } catch (const std::exception& e) {
            mixer_result = std::unexpected(RecorderError{
                Kind::Coordination, std::format("mixer thread failed: {}", e.what())});
        }
        mixer_done.store(true, std::memory_order_release);
    });

    // Declared after the mixer thread so that, when unwinding, the mixer is told
    // to finish before ~jthread joins it.
    struct StopOnExit {
        SessionState& state;
        CaptureStream& mic;
        CaptureStream* system;
        ~StopOnExit() {
            state.request_stop();
            mic.close();
            if (system) system->close();
        }
    } stop_on_exit{state_, **mic_stream, sys_stream.get()};

    std::println("\n=== Recording Started ===");
    std::println("Recording to: {}", path);
    std::println("Format: {} channels, {} Hz", spec.channels, spec.sample_rate);
    std::println("Microphone: {} channels, {} Hz", mic_format.channels, mic_format.sample_rate);
    if (system_) {
        std::println("System audio: {} channels, {} Hz", sys_format.channels, sys_format.sample_rate);
    }

    std::optional<RecorderError> start_error;
    if (!(*mic_stream)->start()) {
        start_error = RecorderError{Kind::Device, "microphone: failed to start stream"};
    } else if (sys_stream && !sys_stream->start()) {
        start_error = RecorderError{Kind::Device, "system audio: failed to start stream"};
    }

    if (start_error) {
        state_.request_stop();
    } else {
        std::println("\nPress Ctrl+C to stop recording...\n");
        wait_for_stop(mixer_done);
    }

    // Streams first, so no callback can run once the queues report closed.
    (*mic_stream)->close();
    if (sys_stream) sys_stream->close();

    mixer_thread.join();
    state_.mark_stopped();

    auto report = [this](const CaptureStream& cs, const SampleQueue& q) {
        if (q.dropped_blocks() > 0) {
            std::println(stderr, "audio: {}: {} blocks dropped, queue full",
                         cs.label(), q.dropped_blocks());
        }
        if (q.rejected_blocks() > 0) {
            std::println(stderr, "audio: {}: {} blocks discarded, mixer no longer receiving",
                         cs.label(), q.rejected_blocks());
        }
        if (cs.stream_errors() > 0) {
            std::println(stderr, "audio: {}: {} stream errors", cs.label(), cs.stream_errors());
        }
        log(std::format("{}: {} blocks captured", cs.label(), cs.blocks_sent()));
    };
    report(**mic_stream, mic_queue);
    if (sys_stream) report(*sys_stream, *sys_queue);

    if (start_error) {
        std::filesystem::remove(path, ec);
        return std::unexpected(*start_error);
    }

    if (!mixer_result) {
        return std::unexpected(RecorderError{Kind::Coordination, "mixer thread produced no result"});
    }
    if (!*mixer_result) {
        return std::unexpected(mixer_result->error());
    }

    const auto& stats = mixer_result->value();
    log(std::format("mixer: mic_samples={}, sys_samples={}, frames mixed={}, passthrough={}, "
                    "flushed={}",
                    stats.samples_received[0], stats.samples_received[1], stats.frames_mixed,
                    stats.frames_passthrough, stats.frames_flushed));

    return RecordingResult{
        .path = path,
        .bytes = stats.output_bytes,
        .frames = stats.frames_written(),
    };
}

void Recorder::wait_for_stop(const std::atomic<bool>& mixer_done) {
    while (state_.running()) {
        if (mixer_done.load(std::memory_order_acquire)) {
            log("mixer stopped early, ending session");
            state_.request_stop();
            break;
        }

        if (interrupt_) {
            if (interrupt_->wait(stop_poll_interval)) {
                std::println("\n\nStopping recording...");
                state_.request_stop();
            }
        } else {
            std::this_thread::sleep_for(stop_poll_interval);
        }
    }
}

void Recorder::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meeting-recorder] {}", msg);
    }
}
