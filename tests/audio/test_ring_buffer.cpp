/**
 * test_ring_buffer.cpp - Capture/playback ring buffer tests
 */

#include "aegis/audio/RingBuffer.hpp"
#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>

using namespace aegis::audio;

void test_basic_push_pop() {
    RingBuffer<float> buffer(1024);

    std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    assert(buffer.push(data.data(), data.size()) == 5);
    assert(buffer.available() == 5);

    std::vector<float> out(5);
    assert(buffer.pop(out.data(), 5) == 5);
    assert(out == data);
    assert(buffer.available() == 0);

    std::cout << "[PASS] test_basic_push_pop" << std::endl;
}

void test_overflow_keeps_oldest() {
    RingBuffer<float> buffer(4);
    assert(buffer.capacity() == 4);

    std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    assert(buffer.push(data.data(), data.size()) == 4);  // Only 4 fit
    assert(buffer.available() == 4);

    std::vector<float> out(8, 0.0f);
    assert(buffer.pop(out.data(), 8) == 4);
    assert(out[0] == 1.0f && out[3] == 4.0f);

    std::cout << "[PASS] test_overflow_keeps_oldest" << std::endl;
}

void test_wraparound() {
    RingBuffer<int16_t> buffer(6);
    std::vector<int16_t> chunk = {1, 2, 3, 4};
    std::vector<int16_t> out(4);

    for (int round = 0; round < 10; ++round) {
        assert(buffer.push(chunk.data(), chunk.size()) == 4);
        assert(buffer.pop(out.data(), out.size()) == 4);
        assert(out == chunk);
    }
    assert(buffer.available() == 0);

    std::cout << "[PASS] test_wraparound" << std::endl;
}

void test_clear_drops_backlog() {
    RingBuffer<float> buffer(512);
    std::vector<float> data(300, 0.5f);
    buffer.push(data.data(), data.size());

    buffer.clear();
    assert(buffer.available() == 0);

    float one = 7.0f;
    assert(buffer.push(&one, 1) == 1);
    float got = 0.0f;
    assert(buffer.pop(&got, 1) == 1);
    assert(got == 7.0f);

    std::cout << "[PASS] test_clear_drops_backlog" << std::endl;
}

void test_concurrent() {
    RingBuffer<float> buffer(1024);
    std::atomic<bool> done{false};
    std::atomic<size_t> total_written{0};
    std::atomic<size_t> total_read{0};

    // Producer (audio callback side)
    std::thread producer([&]() {
        std::vector<float> chunk(64, 1.0f);
        for (int i = 0; i < 100; ++i) {
            total_written += buffer.push(chunk.data(), chunk.size());
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        done = true;
    });

    // Consumer (recorder side)
    std::thread consumer([&]() {
        std::vector<float> chunk(64);
        while (!done || buffer.available() > 0) {
            total_read += buffer.pop(chunk.data(), chunk.size());
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    });

    producer.join();
    consumer.join();

    assert(total_written == total_read);
    std::cout << "[PASS] test_concurrent (written=" << total_written
              << ", read=" << total_read << ")" << std::endl;
}

int main() {
    std::cout << "=== RingBuffer Tests ===" << std::endl;

    test_basic_push_pop();
    test_overflow_keeps_oldest();
    test_wraparound();
    test_clear_drops_backlog();
    test_concurrent();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
