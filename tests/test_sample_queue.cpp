#include <catch2/catch_test_macros.hpp>

#include "sample_queue.hpp"

#include <cstdint>
#include <numeric>
#include <vector>

TEST_CASE("SampleQueue", "[sample_queue]") {
    constexpr size_t cap = 256;
    SampleQueue q(cap);

    SECTION("PushAndDrain") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(q.push(data) == SampleQueue::PushResult::Ok);
        REQUIRE(q.available() == 64);

        std::vector<int16_t> out;
        REQUIRE(q.drain_into(out) == 64);
        REQUIRE(out == data);
        REQUIRE(q.available() == 0);
    }

    SECTION("DrainAppends") {
        std::vector<int16_t> out = {7, 7};
        std::vector<int16_t> data = {1, 2, 3};
        q.push(data);
        q.drain_into(out);
        REQUIRE(out == std::vector<int16_t>{7, 7, 1, 2, 3});
    }

    SECTION("PreservesOrderAcrossBlocks") {
        q.push(std::vector<int16_t>{1, 2});
        q.push(std::vector<int16_t>{3, 4});
        q.push(std::vector<int16_t>{5, 6});

        std::vector<int16_t> out;
        q.drain_into(out);
        REQUIRE(out == std::vector<int16_t>{1, 2, 3, 4, 5, 6});
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200, 1);
        REQUIRE(q.push(fill) == SampleQueue::PushResult::Ok);
        std::vector<int16_t> sink;
        q.drain_into(sink);

        // write position is now 200; 128 samples cross the end of the buffer
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(42));
        REQUIRE(q.push(wrap) == SampleQueue::PushResult::Ok);

        std::vector<int16_t> out;
        REQUIRE(q.drain_into(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("FullBlockIsDroppedWhole") {
        std::vector<int16_t> most(200, 5);
        REQUIRE(q.push(most) == SampleQueue::PushResult::Ok);

        std::vector<int16_t> too_big(100, 9);
        REQUIRE(q.push(too_big) == SampleQueue::PushResult::Full);
        REQUIRE(q.dropped_blocks() == 1);
        REQUIRE(q.available() == 200);

        std::vector<int16_t> fits(56, 9);
        REQUIRE(q.push(fits) == SampleQueue::PushResult::Ok);
        REQUIRE(q.available() == cap);
    }

    SECTION("EmptyBlockIsAccepted") {
        REQUIRE(q.push(std::span<const int16_t>{}) == SampleQueue::PushResult::Ok);
        REQUIRE(q.available() == 0);
    }

    SECTION("ConsumerCloseRejectsPushes") {
        q.close_consumer();
        REQUIRE(q.consumer_closed());

        std::vector<int16_t> data(10, 1);
        REQUIRE(q.push(data) == SampleQueue::PushResult::Closed);
        REQUIRE(q.rejected_blocks() == 1);
        REQUIRE(q.available() == 0);
    }

    SECTION("ProducerCloseKeepsQueuedData") {
        std::vector<int16_t> data(10, 3);
        q.push(data);
        q.close_producer();
        REQUIRE(q.producer_closed());

        std::vector<int16_t> out;
        REQUIRE(q.drain_into(out) == 10);
    }

    SECTION("ZeroCapacityIsClampedToOne") {
        SampleQueue tiny(0);
        REQUIRE(tiny.capacity() == 1);
    }
}
