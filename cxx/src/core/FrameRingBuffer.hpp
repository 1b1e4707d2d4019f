/**
 * @file FrameRingBuffer.hpp
 * @brief Fixed-capacity single-producer/single-consumer queue of PCM frames.
 */

#ifndef MEGAPHONE_FRAME_RING_BUFFER_HPP
#define MEGAPHONE_FRAME_RING_BUFFER_HPP

#include <atomic>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>
#include "PcmFormat.hpp"

namespace megaphone {

/**
 * @brief Busy-wait lock for critical sections of a few hundred nanoseconds.
 *
 * Never sleeps, so a real-time thread is never descheduled waiting on it.
 */
class SpinLock {
public:
    void lock() {
        while (flag_.test_and_set(std::memory_order_acquire)) {
        }
    }

    void unlock() {
        flag_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

/**
 * @brief Queue of fixed-size frames between the capture thread (producer)
 * and the mix thread (consumer).
 *
 * All slots are allocated at construction; push and pop copy one frame
 * by value and never allocate. The lock is held only for the index update
 * and that copy.
 *
 * Overflow: push() refuses; push_overwrite() discards the oldest frame.
 * Underrun: pop() reports empty; the consumer substitutes silence.
 */
class FrameRingBuffer {
public:
    /**
     * @param capacity Maximum backlog in frames (at least 1).
     * @param frame_length Interleaved values per frame.
     */
    FrameRingBuffer(size_t capacity, size_t frame_length);

    FrameRingBuffer(const FrameRingBuffer&) = delete;
    FrameRingBuffer& operator=(const FrameRingBuffer&) = delete;

    /**
     * @brief Append a frame.
     * @return false if the buffer is full (nothing stored).
     */
    bool push(std::span<const Sample> frame);

    /**
     * @brief Append a frame, discarding the oldest one if full (drop-oldest).
     * @return true if a queued frame was discarded.
     */
    bool push_overwrite(std::span<const Sample> frame);

    /**
     * @brief Remove the oldest frame into out.
     * @return false on underrun (out untouched).
     */
    bool pop(std::span<Sample> out);

    /**
     * @brief Allocating variant of pop() for non real-time callers.
     */
    std::optional<std::vector<Sample>> pop();

    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }
    size_t frame_length() const { return frame_length_; }

private:
    void write_slot(size_t slot, std::span<const Sample> frame);

    const size_t capacity_;
    const size_t frame_length_;
    std::vector<Sample> storage_;

    size_t head_ = 0;  // next slot to read
    size_t count_ = 0;
    mutable SpinLock lock_;
};

} // namespace megaphone

#endif // MEGAPHONE_FRAME_RING_BUFFER_HPP
