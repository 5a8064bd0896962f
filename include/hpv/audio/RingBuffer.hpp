/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer sample queue
 *
 * The event loop produces playback samples, the PortAudio output callback
 * consumes them.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <vector>

namespace hpv::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : storage_(capacity + 1) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * Append up to count items. Returns how many fit.
     */
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t free_slots = freeSlots(read, write);
        const size_t n = std::min(count, free_slots);

        for (size_t i = 0; i < n; ++i) {
            storage_[(write + i) % storage_.size()] = data[i];
        }
        write_.store((write + n) % storage_.size(), std::memory_order_release);
        return n;
    }

    /**
     * Remove up to count items into out. Returns how many were read.
     */
    size_t pop(T* out, size_t count) {
        const size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);
        const size_t n = std::min(count, used(read, write));

        for (size_t i = 0; i < n; ++i) {
            out[i] = storage_[(read + i) % storage_.size()];
        }
        read_.store((read + n) % storage_.size(), std::memory_order_release);
        return n;
    }

    size_t available() const {
        return used(read_.load(std::memory_order_acquire), write_.load(std::memory_order_acquire));
    }

    size_t capacity() const { return storage_.size() - 1; }

    /**
     * Drop everything queued. A concurrent pop may still return a few
     * samples that were already in flight.
     */
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    size_t used(size_t read, size_t write) const {
        return (write + storage_.size() - read) % storage_.size();
    }

    size_t freeSlots(size_t read, size_t write) const {
        return capacity() - used(read, write);
    }

    std::vector<T> storage_;
    std::atomic<size_t> read_{0};
    std::atomic<size_t> write_{0};
};

} // namespace hpv::audio
