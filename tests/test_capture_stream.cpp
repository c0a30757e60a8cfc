#include <catch2/catch_test_macros.hpp>

#include "capture_stream.hpp"
#include "fake_backend.hpp"

#include <cmath>
#include <limits>
#include <vector>

using test::FakeBackend;
using test::make_device;

TEST_CASE("FloatToInt16", "[capture]") {
    REQUIRE(to_int16(0.0f) == 0);
    REQUIRE(to_int16(1.0f) == 32767);
    REQUIRE(to_int16(-1.0f) == -32767);
    REQUIRE(to_int16(0.5f) == 16383);
    REQUIRE(to_int16(2.5f) == 32767);
    REQUIRE(to_int16(-7.0f) == -32767);
    REQUIRE(to_int16(std::numeric_limits<float>::quiet_NaN()) == 0);
}

TEST_CASE("CaptureStream", "[capture]") {
    FakeBackend backend;
    auto mic = make_device(1, "mic", 1);
    SampleQueue queue(1024);
    SessionState state;

    SECTION("ConvertsAndEnqueues") {
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, queue, state, "microphone");
        REQUIRE(cs.has_value());

        backend.opened["mic"]->emit({0.0f, 1.0f, -1.0f, 0.25f});

        std::vector<int16_t> out;
        REQUIRE(queue.drain_into(out) == 4);
        REQUIRE(out == std::vector<int16_t>{0, 32767, -32767, 8191});
        REQUIRE((*cs)->blocks_sent() == 1);
    }

    SECTION("DiscardsOnceStopped") {
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, queue, state, "microphone");
        REQUIRE(cs.has_value());

        state.request_stop();
        backend.opened["mic"]->emit({0.5f, 0.5f});
        REQUIRE(queue.available() == 0);
        REQUIRE((*cs)->blocks_sent() == 0);
    }

    SECTION("OversizedCallbackIsSplitOnFrames") {
        SampleQueue big(100000);
        auto cs = CaptureStream::open(backend, mic, {2, 48000}, big, state, "stereo");
        REQUIRE(cs.has_value());

        std::vector<float> block(40000, 0.1f);
        backend.opened["mic"]->emit(block);
        REQUIRE(big.available() == 40000);
        REQUIRE((*cs)->blocks_sent() == 3);
    }

    SECTION("FullQueueDropsBlock") {
        SampleQueue small(4);
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, small, state, "microphone");
        REQUIRE(cs.has_value());

        backend.opened["mic"]->emit({0.1f, 0.1f, 0.1f});
        backend.opened["mic"]->emit({0.1f, 0.1f, 0.1f});
        REQUIRE(small.available() == 3);
        REQUIRE(small.dropped_blocks() == 1);
        REQUIRE((*cs)->blocks_sent() == 1);
    }

    SECTION("CloseStopsStreamAndClosesProducer") {
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, queue, state, "microphone");
        REQUIRE(cs.has_value());
        REQUIRE((*cs)->start());
        REQUIRE(backend.opened["mic"]->is_capturing());

        (*cs)->close();
        REQUIRE_FALSE(backend.opened["mic"]->is_capturing());
        REQUIRE(queue.producer_closed());

        // Idempotent, and no restart after close
        (*cs)->close();
        REQUIRE_FALSE((*cs)->start());
    }

    SECTION("StreamErrorsAreCounted") {
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, queue, state, "microphone");
        REQUIRE(cs.has_value());
        backend.opened["mic"]->raise_error("device unplugged");
        REQUIRE((*cs)->stream_errors() == 1);
    }

    SECTION("OpenFailurePropagates") {
        backend.fail_open.insert("mic");
        auto cs = CaptureStream::open(backend, mic, {1, 48000}, queue, state, "microphone");
        REQUIRE_FALSE(cs.has_value());
        REQUIRE(cs.error() == "microphone: device busy");
    }

    SECTION("RejectsZeroChannels") {
        auto cs = CaptureStream::open(backend, mic, {0, 48000}, queue, state, "microphone");
        REQUIRE_FALSE(cs.has_value());
    }
}
