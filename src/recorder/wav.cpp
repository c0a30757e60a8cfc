#include "wav.hpp"

#include <filesystem>
#include <format>
#include <fstream>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

std::expected<Info, std::string> inspect(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("cannot open {}", path));
    }

    std::array<uint8_t, header_size> buf{};
    f.read(reinterpret_cast<char*>(buf.data()), buf.size());
    auto got = static_cast<size_t>(f.gcount());

    if (got < 12) {
        return std::unexpected("file too small to be a WAV file");
    }
    if (!tag_is(buf.data(), "RIFF")) {
        return std::unexpected("invalid RIFF header");
    }
    if (!tag_is(buf.data() + 8, "WAVE")) {
        return std::unexpected("invalid WAVE identifier");
    }
    if (got < header_size) {
        return std::unexpected("file too small to hold a PCM header");
    }
    if (!tag_is(buf.data() + 12, "fmt ")) {
        return std::unexpected("format chunk not found");
    }
    if (!tag_is(buf.data() + 36, "data")) {
        return std::unexpected("data chunk not found");
    }

    std::error_code ec;
    auto file_bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot stat {}: {}", path, ec.message()));
    }
    if (file_bytes <= header_size) {
        return std::unexpected("file contains only headers, no audio data");
    }

    Info info;
    info.spec.channels = read_u16(buf.data() + 22);
    info.spec.sample_rate = read_u32(buf.data() + 24);
    info.spec.bits_per_sample = read_u16(buf.data() + 34);
    info.data_bytes = read_u32(buf.data() + 40);
    info.file_bytes = file_bytes;

    if (read_u32(buf.data() + 4) != 36 + info.data_bytes) {
        return std::unexpected("RIFF size does not match data size");
    }
    if (header_size + static_cast<uint64_t>(info.data_bytes) > file_bytes) {
        return std::unexpected("data size exceeds file length");
    }
    return info;
}

} // namespace wav
