#include "mixer.hpp"

#include <thread>

namespace mix {

void append_stereo(std::vector<int16_t>& dst, std::span<const int16_t> src, uint16_t channels) {
    if (channels == 1) {
        dst.reserve(dst.size() + src.size() * 2);
        for (int16_t s : src) {
            dst.push_back(s);
            dst.push_back(s);
        }
        return;
    }
    if (channels == 0) return;

    size_t frames = src.size() / channels;
    if (channels == 2) {
        dst.insert(dst.end(), src.begin(), src.begin() + frames * 2);
        return;
    }

    dst.reserve(dst.size() + frames * 2);
    for (size_t f = 0; f < frames; ++f) {
        dst.push_back(src[f * channels]);
        dst.push_back(src[f * channels + 1]);
    }
}

} // namespace mix

Mixer::Mixer(SampleQueue& mic, SourceFormat mic_format,
             SampleQueue* system, SourceFormat system_format,
             FrameSink& sink, const SessionState& state,
             std::chrono::milliseconds idle_sleep)
    : queues_{&mic, system},
      formats_{mic_format, system_format},
      sink_(sink), state_(state), idle_sleep_(idle_sleep) {}

std::expected<MixerStats, RecorderError> Mixer::run() {
    for (;;) {
        // Closure must be observed before the drain, so that the drain that
        // follows is guaranteed to see everything the producers pushed.
        bool stopping = !state_.running() && producers_closed();

        auto received = step();
        if (!received) {
            close_consumers();
            return std::unexpected(received.error());
        }

        if (stopping && !*received) break;

        if (!*received) {
            std::this_thread::sleep_for(idle_sleep_);
        }
    }

    close_consumers();

    if (auto r = flush(); !r) {
        return std::unexpected(r.error());
    }

    auto size = sink_.finalize();
    if (!size) {
        return std::unexpected(RecorderError{RecorderError::Kind::SinkFinalize, size.error()});
    }
    stats_.output_bytes = *size;
    return stats_;
}

std::expected<bool, RecorderError> Mixer::step() {
    bool received = false;

    for (size_t i = 0; i < queues_.size(); ++i) {
        if (!queues_[i]) continue;
        scratch_.clear();
        size_t n = queues_[i]->drain_into(scratch_);
        if (n == 0) continue;
        received = true;
        stats_.samples_received[i] += n;
        mix::append_stereo(buffers_[i], scratch_, formats_[i].channels);
    }

    auto& mic = buffers_[index(Source::Mic)];
    auto& sys = buffers_[index(Source::System)];

    size_t min_len = std::min(mic.size(), sys.size()) & ~size_t(1);
    for (size_t i = 0; i < min_len; i += 2) {
        auto r = write(mix::add_clamped(mic[i], sys[i]),
                       mix::add_clamped(mic[i + 1], sys[i + 1]));
        if (!r) return std::unexpected(r.error());
        ++stats_.frames_mixed;
    }
    mic.erase(mic.begin(), mic.begin() + min_len);
    sys.erase(sys.begin(), sys.begin() + min_len);

    // A source with no counterpart data is written through rather than held back.
    if (sys.empty() && mic.size() >= 2) {
        if (auto r = pass_through(mic); !r) return std::unexpected(r.error());
    } else if (mic.empty() && sys.size() >= 2) {
        if (auto r = pass_through(sys); !r) return std::unexpected(r.error());
    }

    return received;
}

std::expected<void, RecorderError> Mixer::flush() {
    auto& mic = buffers_[index(Source::Mic)];
    auto& sys = buffers_[index(Source::System)];

    auto at = [](const std::vector<int16_t>& buf, size_t i) -> int16_t {
        return i < buf.size() ? buf[i] : 0;
    };

    size_t max_len = std::max(mic.size(), sys.size());
    for (size_t i = 0; i < max_len; i += 2) {
        auto r = write(mix::add_clamped(at(mic, i), at(sys, i)),
                       mix::add_clamped(at(mic, i + 1), at(sys, i + 1)));
        if (!r) return std::unexpected(r.error());
        ++stats_.frames_flushed;
    }
    mic.clear();
    sys.clear();
    return {};
}

std::expected<void, RecorderError> Mixer::pass_through(std::vector<int16_t>& buf) {
    size_t len = buf.size() & ~size_t(1);
    for (size_t i = 0; i < len; i += 2) {
        if (auto r = write(buf[i], buf[i + 1]); !r) return std::unexpected(r.error());
        ++stats_.frames_passthrough;
    }
    buf.erase(buf.begin(), buf.begin() + len);
    return {};
}

std::expected<void, RecorderError> Mixer::write(int16_t left, int16_t right) {
    auto r = sink_.write_frame(left, right);
    if (!r) {
        return std::unexpected(RecorderError{RecorderError::Kind::SinkWrite, r.error()});
    }
    return {};
}

bool Mixer::producers_closed() const {
    return std::ranges::all_of(queues_, [](const SampleQueue* q) {
        return q == nullptr || q->producer_closed();
    });
}

void Mixer::close_consumers() {
    for (auto* q : queues_) {
        if (q) q->close_consumer();
    }
}
