/**
 * test_ring_buffer.cpp - Unit test for lock-free ring buffer
 */

#include "parley/audio/RingBuffer.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace parley::audio;

void test_basic_push_pop() {
    RingBuffer<int16_t> buffer(1024);

    std::vector<int16_t> data = {1, 2, 3, 4, 5};
    assert(buffer.push(data.data(), data.size()) == 5);
    assert(buffer.available() == 5);

    std::vector<int16_t> out(5);
    assert(buffer.pop(out.data(), 5) == 5);
    assert(out == data);
    assert(buffer.available() == 0);

    std::cout << "[PASS] test_basic_push_pop" << std::endl;
}

void test_overflow() {
    RingBuffer<int16_t> buffer(4);

    std::vector<int16_t> data = {1, 2, 3, 4, 5};
    assert(buffer.push(data.data(), data.size()) == 4);  // Only 4 fit
    assert(buffer.available() == 4);
    assert(buffer.capacity() == 4);

    std::cout << "[PASS] test_overflow" << std::endl;
}

void test_wraparound() {
    RingBuffer<int16_t> buffer(4);
    std::vector<int16_t> out(4);

    for (int16_t round = 0; round < 10; ++round) {
        std::vector<int16_t> data = {round, static_cast<int16_t>(round + 1), static_cast<int16_t>(round + 2)};
        assert(buffer.push(data.data(), data.size()) == 3);
        assert(buffer.pop(out.data(), 3) == 3);
        assert(out[0] == round && out[2] == round + 2);
    }

    std::cout << "[PASS] test_wraparound" << std::endl;
}

void test_clear() {
    RingBuffer<int16_t> buffer(16);
    std::vector<int16_t> data(10, 7);
    buffer.push(data.data(), data.size());

    buffer.clear();
    assert(buffer.available() == 0);

    std::vector<int16_t> out(4);
    assert(buffer.pop(out.data(), 4) == 0);
    assert(buffer.push(data.data(), 4) == 4);

    std::cout << "[PASS] test_clear" << std::endl;
}

void test_concurrent() {
    RingBuffer<int16_t> buffer(1024);
    std::atomic<bool> done{false};
    std::atomic<size_t> total_written{0};
    std::atomic<size_t> total_read{0};
    std::atomic<bool> ordered{true};

    // Producer: increasing sequence, retried until it fits
    std::thread producer([&]() {
        int16_t next = 0;
        for (int i = 0; i < 100; ++i) {
            std::vector<int16_t> chunk(64);
            for (auto& s : chunk) {
                s = next++;
            }
            size_t offset = 0;
            while (offset < chunk.size()) {
                offset += buffer.push(chunk.data() + offset, chunk.size() - offset);
            }
            total_written += chunk.size();
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        done = true;
    });

    // Consumer
    std::thread consumer([&]() {
        std::vector<int16_t> chunk(64);
        int16_t expected = 0;
        while (!done || buffer.available() > 0) {
            size_t n = buffer.pop(chunk.data(), chunk.size());
            for (size_t i = 0; i < n; ++i) {
                if (chunk[i] != expected++) {
                    ordered = false;
                }
            }
            total_read += n;
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    });

    producer.join();
    consumer.join();

    assert(ordered);
    assert(total_written == total_read);

    std::cout << "[PASS] test_concurrent (written=" << total_written
              << ", read=" << total_read << ")" << std::endl;
}

int main() {
    std::cout << "=== RingBuffer Tests ===" << std::endl;

    test_basic_push_pop();
    test_overflow();
    test_wraparound();
    test_clear();
    test_concurrent();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
