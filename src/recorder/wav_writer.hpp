#pragma once

#include "frame_sink.hpp"
#include "wav.hpp"

#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

// Streams 16-bit stereo PCM frames to disk. The header is written with zero
// sizes up front and back-patched by finalize().
class WavWriter : public FrameSink {
public:
    static std::expected<std::unique_ptr<WavWriter>, std::string>
        create(const std::string& path, const wav::Spec& spec);

    // An unfinalized writer still flushes and patches the header on destruction,
    // so an aborted session leaves a playable file.
    ~WavWriter() override;

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    std::expected<void, std::string> write_frame(int16_t left, int16_t right) override;
    std::expected<uint64_t, std::string> finalize() override;
    bool finalized() const override { return finalized_; }

    const std::string& path() const { return path_; }
    uint64_t frames_written() const { return frames_; }

private:
    struct Token {};

public:
    WavWriter(Token, std::string path, const wav::Spec& spec);

private:
    std::expected<void, std::string> flush_pending();
    std::expected<void, std::string> patch_header(uint32_t data_bytes);

    static constexpr size_t flush_samples = 8192;

    std::string path_;
    wav::Spec spec_;
    std::ofstream out_;
    std::vector<int16_t> pending_;
    uint64_t frames_ = 0;
    uint64_t data_bytes_ = 0;
    bool finalized_ = false;
};
