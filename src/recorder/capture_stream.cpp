#include "capture_stream.hpp"

#include <format>
#include <print>

std::expected<std::unique_ptr<CaptureStream>, std::string>
CaptureStream::open(AudioBackend& backend, const DeviceInfo& device, StreamFormat format,
                    SampleQueue& queue, const SessionState& state, std::string label) {
    if (format.channels == 0 || format.sample_rate == 0) {
        return std::unexpected(std::format("{}: unsupported stream format {} ch, {} Hz",
                                           label, format.channels, format.sample_rate));
    }

    auto cs = std::make_unique<CaptureStream>(Token{}, queue, state, format, std::move(label));
    auto* self = cs.get();

    auto stream = backend.open_input(
        device, format,
        [self](std::span<const float> data) { self->on_data(data); },
        [self](const std::string& msg) { self->on_error(msg); });
    if (!stream) {
        return std::unexpected(std::format("{}: {}", cs->label_, stream.error()));
    }

    cs->stream_ = std::move(*stream);
    return cs;
}

CaptureStream::CaptureStream(Token, SampleQueue& queue, const SessionState& state,
                             StreamFormat format, std::string label)
    : queue_(queue), state_(state), format_(format), label_(std::move(label)),
      scratch_(max_block_samples - max_block_samples % format.channels) {}

CaptureStream::~CaptureStream() {
    close();
}

bool CaptureStream::start() {
    if (!stream_ || closed_) return false;
    return stream_->start();
}

void CaptureStream::close() {
    if (closed_) return;
    closed_ = true;
    if (stream_) stream_->stop();
    queue_.close_producer();
}

void CaptureStream::on_data(std::span<const float> data) {
    if (!state_.running()) return;

    while (!data.empty()) {
        size_t n = std::min(data.size(), scratch_.size());
        for (size_t i = 0; i < n; ++i) {
            scratch_[i] = to_int16(data[i]);
        }
        data = data.subspan(n);

        // Full and Closed are counted by the queue and reported after stop.
        if (queue_.push(std::span<const int16_t>(scratch_.data(), n)) ==
            SampleQueue::PushResult::Ok) {
            blocks_sent_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void CaptureStream::on_error(const std::string& message) {
    stream_errors_.fetch_add(1, std::memory_order_relaxed);
    std::println(stderr, "audio: {} stream error: {}", label_, message);
}
