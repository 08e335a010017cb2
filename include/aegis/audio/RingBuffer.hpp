/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer sample buffer
 *
 * The PortAudio callback is the producer for capture and the consumer for
 * playback, so neither side may block.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace aegis::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
        , capacity_(capacity) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    // Writes as many samples as fit; returns the number written.
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t slots = buffer_.size();

        size_t free_space = (read + slots - write - 1) % slots;
        size_t n = count < free_space ? count : free_space;

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % slots] = data[i];
        }
        write_.store((write + n) % slots, std::memory_order_release);
        return n;
    }

    // Reads up to count samples; returns the number read.
    size_t pop(T* out, size_t count) {
        const size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t slots = buffer_.size();

        size_t used = (write + slots - read) % slots;
        size_t n = count < used ? count : used;

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % slots];
        }
        read_.store((read + n) % slots, std::memory_order_release);
        return n;
    }

    size_t available() const {
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t read = read_.load(std::memory_order_acquire);
        return (write + buffer_.size() - read) % buffer_.size();
    }

    // Consumer side only.
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

    size_t capacity() const { return capacity_; }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> write_{0};
    std::atomic<size_t> read_{0};
};

} // namespace aegis::audio
