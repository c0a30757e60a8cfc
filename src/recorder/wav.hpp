#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <string>

// Canonical 44-byte PCM WAV layout shared by the writer and the inspector.
namespace wav {

constexpr size_t header_size = 44;

struct Spec {
    uint16_t channels = 2;
    uint32_t sample_rate = 48000;
    uint16_t bits_per_sample = 16;

    uint16_t block_align() const { return channels * bits_per_sample / 8; }
    uint32_t byte_rate() const { return sample_rate * block_align(); }
};

struct Info {
    Spec spec;
    uint32_t data_bytes = 0;
    uint64_t file_bytes = 0;

    uint64_t frames() const {
        return spec.block_align() ? data_bytes / spec.block_align() : 0;
    }
};

inline std::array<uint8_t, header_size> header(const Spec& spec, uint32_t data_bytes) {
    std::array<uint8_t, header_size> out{};
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_bytes);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(spec.channels);
    w32(spec.sample_rate);
    w32(spec.byte_rate());
    w16(spec.block_align());
    w16(spec.bits_per_sample);
    w("data", 4);
    w32(data_bytes);
    return out;
}

// Sanity-checks the header of an already-written file.
std::expected<Info, std::string> inspect(const std::string& path);

} // namespace wav
