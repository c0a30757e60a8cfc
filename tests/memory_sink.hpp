#pragma once

#include "frame_sink.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace test {

// FrameSink that keeps frames in memory and can be told to fail.
class MemorySink : public FrameSink {
public:
    std::vector<std::pair<int16_t, int16_t>> frames;
    std::optional<size_t> fail_write_at; // fail the Nth write (0-based)
    bool fail_finalize = false;
    int finalize_calls = 0;
    std::function<void()> on_finalize; // runs on the mixer thread, before finalizing

    std::expected<void, std::string> write_frame(int16_t left, int16_t right) override {
        if (finalized_) return std::unexpected("write after finalize");
        if (fail_write_at && frames.size() == *fail_write_at) {
            return std::unexpected("disk full");
        }
        frames.emplace_back(left, right);
        return {};
    }

    std::expected<uint64_t, std::string> finalize() override {
        ++finalize_calls;
        if (on_finalize) on_finalize();
        if (finalized_) return std::unexpected("already finalized");
        finalized_ = true;
        if (fail_finalize) return std::unexpected("cannot patch header");
        return 44 + frames.size() * 4;
    }

    bool finalized() const override { return finalized_; }

private:
    bool finalized_ = false;
};

} // namespace test
