#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"
#include "wav.hpp"
#include "wav_writer.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace {

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

uint16_t u16_at(const std::vector<uint8_t>& b, size_t off) {
    uint16_t v;
    std::memcpy(&v, b.data() + off, 2);
    return v;
}

uint32_t u32_at(const std::vector<uint8_t>& b, size_t off) {
    uint32_t v;
    std::memcpy(&v, b.data() + off, 4);
    return v;
}

void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace

TEST_CASE("WavHeader", "[wav]") {
    wav::Spec spec{.channels = 2, .sample_rate = 48000, .bits_per_sample = 16};
    auto h = wav::header(spec, 400);
    std::vector<uint8_t> b(h.begin(), h.end());

    REQUIRE(std::memcmp(b.data(), "RIFF", 4) == 0);
    REQUIRE(u32_at(b, 4) == 436);
    REQUIRE(std::memcmp(b.data() + 8, "WAVE", 4) == 0);
    REQUIRE(std::memcmp(b.data() + 12, "fmt ", 4) == 0);
    REQUIRE(u32_at(b, 16) == 16);
    REQUIRE(u16_at(b, 20) == 1);
    REQUIRE(u16_at(b, 22) == 2);
    REQUIRE(u32_at(b, 24) == 48000);
    REQUIRE(u32_at(b, 28) == 48000 * 4);
    REQUIRE(u16_at(b, 32) == 4);
    REQUIRE(u16_at(b, 34) == 16);
    REQUIRE(std::memcmp(b.data() + 36, "data", 4) == 0);
    REQUIRE(u32_at(b, 40) == 400);
}

TEST_CASE("WavWriter", "[wav]") {
    test::TmpDir dir;
    auto path = dir.file("out.wav");
    wav::Spec spec{.channels = 2, .sample_rate = 44100, .bits_per_sample = 16};

    SECTION("FinalizePatchesSizes") {
        auto w = WavWriter::create(path, spec);
        REQUIRE(w.has_value());

        REQUIRE((*w)->write_frame(1, -1).has_value());
        REQUIRE((*w)->write_frame(32767, -32768).has_value());
        REQUIRE((*w)->write_frame(0, 0).has_value());
        REQUIRE((*w)->frames_written() == 3);

        auto size = (*w)->finalize();
        REQUIRE(size.has_value());
        REQUIRE(*size == 44 + 12);
        REQUIRE((*w)->finalized());

        auto b = read_all(path);
        REQUIRE(b.size() == 56);
        REQUIRE(u32_at(b, 4) == 36 + 12);
        REQUIRE(u32_at(b, 24) == 44100);
        REQUIRE(u32_at(b, 40) == 12);
        REQUIRE(static_cast<int16_t>(u16_at(b, 44)) == 1);
        REQUIRE(static_cast<int16_t>(u16_at(b, 46)) == -1);
        REQUIRE(static_cast<int16_t>(u16_at(b, 48)) == 32767);
        REQUIRE(static_cast<int16_t>(u16_at(b, 50)) == -32768);
    }

    SECTION("LargeWriteCrossesFlushBoundary") {
        auto w = WavWriter::create(path, spec);
        REQUIRE(w.has_value());
        for (int i = 0; i < 10000; i++) {
            REQUIRE((*w)->write_frame(static_cast<int16_t>(i), 0).has_value());
        }
        REQUIRE((*w)->finalize().has_value());

        auto info = wav::inspect(path);
        REQUIRE(info.has_value());
        REQUIRE(info->frames() == 10000);
        REQUIRE(info->file_bytes == 44 + 40000);
    }

    SECTION("UnfinalizedWriterStillPatchesHeader") {
        {
            auto w = WavWriter::create(path, spec);
            REQUIRE(w.has_value());
            // Two full flushes plus a pending tail
            for (int i = 0; i < 10000; i++) {
                REQUIRE((*w)->write_frame(static_cast<int16_t>(i), static_cast<int16_t>(-i)).has_value());
            }
        }

        auto info = wav::inspect(path);
        REQUIRE(info.has_value());
        REQUIRE(info->frames() == 10000);
        REQUIRE(info->data_bytes == 40000);
        REQUIRE(info->file_bytes == 44 + 40000);

        auto b = read_all(path);
        REQUIRE(static_cast<int16_t>(u16_at(b, 44 + 9999 * 4)) == 9999);
        REQUIRE(static_cast<int16_t>(u16_at(b, 44 + 9999 * 4 + 2)) == -9999);
    }

    SECTION("UnfinalizedEmptyWriterKeepsValidHeader") {
        {
            auto w = WavWriter::create(path, spec);
            REQUIRE(w.has_value());
        }
        auto b = read_all(path);
        REQUIRE(b.size() == 44);
        REQUIRE(u32_at(b, 4) == 36);
        REQUIRE(u32_at(b, 40) == 0);
    }

    SECTION("WriteAfterFinalizeFails") {
        auto w = WavWriter::create(path, spec);
        REQUIRE(w.has_value());
        REQUIRE((*w)->finalize().has_value());

        auto r = (*w)->write_frame(1, 1);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "write after finalize");
    }

    SECTION("DoubleFinalizeFails") {
        auto w = WavWriter::create(path, spec);
        REQUIRE(w.has_value());
        REQUIRE((*w)->finalize().has_value());
        auto again = (*w)->finalize();
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error() == "already finalized");
    }

    SECTION("RejectsNonStereoLayout") {
        wav::Spec mono = spec;
        mono.channels = 1;
        REQUIRE_FALSE(WavWriter::create(path, mono).has_value());
    }

    SECTION("CreateFailsInMissingDirectory") {
        REQUIRE_FALSE(WavWriter::create(dir.file("missing/out.wav"), spec).has_value());
    }
}

TEST_CASE("WavInspect", "[wav]") {
    test::TmpDir dir;
    auto path = dir.file("check.wav");
    wav::Spec spec{.channels = 2, .sample_rate = 48000, .bits_per_sample = 16};

    SECTION("ValidFile") {
        auto h = wav::header(spec, 8);
        std::vector<uint8_t> bytes(h.begin(), h.end());
        bytes.resize(bytes.size() + 8, 0);
        write_bytes(path, bytes);

        auto info = wav::inspect(path);
        REQUIRE(info.has_value());
        REQUIRE(info->spec.channels == 2);
        REQUIRE(info->spec.sample_rate == 48000);
        REQUIRE(info->data_bytes == 8);
        REQUIRE(info->frames() == 2);
    }

    SECTION("MissingFile") {
        REQUIRE_FALSE(wav::inspect(dir.file("nope.wav")).has_value());
    }

    SECTION("TooSmall") {
        write_bytes(path, {'R', 'I', 'F', 'F'});
        auto info = wav::inspect(path);
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error() == "file too small to be a WAV file");
    }

    SECTION("NotRiff") {
        std::vector<uint8_t> bytes(64, 0);
        write_bytes(path, bytes);
        REQUIRE(wav::inspect(path).error() == "invalid RIFF header");
    }

    SECTION("HeaderOnly") {
        auto h = wav::header(spec, 0);
        write_bytes(path, {h.begin(), h.end()});
        REQUIRE(wav::inspect(path).error() == "file contains only headers, no audio data");
    }

    SECTION("DataSizeBeyondFile") {
        auto h = wav::header(spec, 1000);
        std::vector<uint8_t> bytes(h.begin(), h.end());
        bytes.resize(bytes.size() + 8, 0);
        write_bytes(path, bytes);
        REQUIRE(wav::inspect(path).error() == "data size exceeds file length");
    }
}
