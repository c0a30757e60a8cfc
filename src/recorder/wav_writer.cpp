#include "wav_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <limits>
#include <print>

namespace {

// RIFF sizes are 32-bit and count everything after the first 8 bytes.
constexpr uint64_t max_data_bytes = std::numeric_limits<uint32_t>::max() - 36;

} // namespace

std::expected<std::unique_ptr<WavWriter>, std::string>
WavWriter::create(const std::string& path, const wav::Spec& spec) {
    if (spec.channels != 2 || spec.bits_per_sample != 16) {
        return std::unexpected(std::format("unsupported WAV layout: {} ch, {} bit",
                                           spec.channels, spec.bits_per_sample));
    }

    auto w = std::make_unique<WavWriter>(Token{}, path, spec);
    w->out_.open(path, std::ios::binary | std::ios::trunc);
    if (!w->out_.is_open()) {
        return std::unexpected(std::format("cannot create {}", path));
    }

    auto hdr = wav::header(spec, 0);
    w->out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    if (!w->out_) {
        return std::unexpected(std::format("cannot write header to {}", path));
    }

    w->pending_.reserve(flush_samples);
    return w;
}

WavWriter::WavWriter(Token, std::string path, const wav::Spec& spec)
    : path_(std::move(path)), spec_(spec) {}

WavWriter::~WavWriter() {
    if (finalized_ || !out_.is_open()) return;

    // Size the data chunk from what actually reached the file.
    auto flushed = flush_pending();
    out_.clear();
    auto end = static_cast<std::streamoff>(out_.tellp());
    uint64_t on_disk = end > static_cast<std::streamoff>(wav::header_size)
        ? static_cast<uint64_t>(end) - wav::header_size : 0;
    on_disk -= on_disk % spec_.block_align();
    on_disk = std::min(on_disk, max_data_bytes);

    auto patched = patch_header(static_cast<uint32_t>(on_disk));
    out_.close();
    std::println(stderr, "wav: {} closed without finalize, kept {} frames{}", path_,
                 on_disk / spec_.block_align(),
                 flushed && patched ? "" : " (header may be incomplete)");
}

std::expected<void, std::string> WavWriter::write_frame(int16_t left, int16_t right) {
    if (finalized_) {
        return std::unexpected("write after finalize");
    }
    if (data_bytes_ + spec_.block_align() > max_data_bytes) {
        return std::unexpected("WAV size limit reached");
    }

    pending_.push_back(left);
    pending_.push_back(right);
    ++frames_;
    data_bytes_ += spec_.block_align();

    if (pending_.size() >= flush_samples) {
        return flush_pending();
    }
    return {};
}

std::expected<void, std::string> WavWriter::flush_pending() {
    if (pending_.empty()) return {};

    out_.write(reinterpret_cast<const char*>(pending_.data()),
               static_cast<std::streamsize>(pending_.size() * sizeof(int16_t)));
    pending_.clear();
    if (!out_) {
        return std::unexpected(std::format("write to {} failed", path_));
    }
    return {};
}

std::expected<uint64_t, std::string> WavWriter::finalize() {
    if (finalized_) {
        return std::unexpected("already finalized");
    }
    finalized_ = true;

    if (auto r = flush_pending(); !r) {
        return std::unexpected(r.error());
    }

    if (auto r = patch_header(static_cast<uint32_t>(data_bytes_)); !r) {
        return std::unexpected(r.error());
    }

    out_.close();
    if (out_.fail()) {
        return std::unexpected(std::format("cannot close {}", path_));
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return std::unexpected(std::format("cannot stat {}: {}", path_, ec.message()));
    }
    return size;
}

std::expected<void, std::string> WavWriter::patch_header(uint32_t data_bytes) {
    auto hdr = wav::header(spec_, data_bytes);
    out_.seekp(0);
    out_.write(reinterpret_cast<const char*>(hdr.data()), hdr.size());
    out_.flush();
    if (!out_) {
        return std::unexpected(std::format("cannot patch header of {}", path_));
    }
    return {};
}
