#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer queue of int16 samples.
// Producer (audio callback thread) calls push(). Consumer (mixer thread) calls drain_into().
// A block is accepted whole or not at all, so interleaved frames are never split.
class SampleQueue {
public:
    enum class PushResult { Ok, Full, Closed };

    explicit SampleQueue(size_t capacity_samples)
        : buf_(std::max<size_t>(capacity_samples, 1)), capacity_(buf_.size()) {}

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    // Producer: append a whole block. Never blocks.
    PushResult push(std::span<const int16_t> block) {
        if (consumer_closed_.load(std::memory_order_acquire)) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return PushResult::Closed;
        }
        if (block.empty()) return PushResult::Ok;

        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        if (block.size() > avail) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return PushResult::Full;
        }

        size_t offset = w % capacity_;
        size_t first = std::min(block.size(), capacity_ - offset);
        std::copy_n(block.data(), first, buf_.data() + offset);
        if (first < block.size()) {
            std::copy_n(block.data() + first, block.size() - first, buf_.data());
        }

        write_pos_.store(w + block.size(), std::memory_order_release);
        return PushResult::Ok;
    }

    // Consumer: append everything currently queued to out. Returns samples moved.
    size_t drain_into(std::vector<int16_t>& out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t avail = w - r;
        if (avail == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(avail, capacity_ - offset);
        out.insert(out.end(), buf_.begin() + offset, buf_.begin() + offset + first);
        if (first < avail) {
            out.insert(out.end(), buf_.begin(), buf_.begin() + (avail - first));
        }

        read_pos_.store(r + avail, std::memory_order_release);
        return avail;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    // Producer side is gone: no further push() will happen.
    void close_producer() { producer_closed_.store(true, std::memory_order_release); }
    bool producer_closed() const { return producer_closed_.load(std::memory_order_acquire); }

    // Consumer side is gone: further push() calls fail with Closed.
    void close_consumer() { consumer_closed_.store(true, std::memory_order_release); }
    bool consumer_closed() const { return consumer_closed_.load(std::memory_order_acquire); }

    // Blocks discarded because the queue was full.
    uint64_t dropped_blocks() const { return dropped_.load(std::memory_order_relaxed); }
    // Blocks discarded because the consumer had closed.
    uint64_t rejected_blocks() const { return rejected_.load(std::memory_order_relaxed); }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<bool> producer_closed_{false};
    std::atomic<bool> consumer_closed_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> rejected_{0};
};
