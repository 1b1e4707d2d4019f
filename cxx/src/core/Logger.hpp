/**
 * @file Logger.hpp
 * @brief RT-safe telemetry logging for the capture and playback threads.
 */

#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <optional>
#include <ostream>
#include <cstring>
#include <cstdint>
#include <cstddef>

namespace megaphone {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};      // Category or Tag
    float value = 0.0f;     // Numeric value (for Type::Event)
    char message[64] = {};  // Static message (for Type::Message)
    uint64_t timestamp_us = 0;
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer.
 *
 * pop() moves the item out of its slot so that resources held by T
 * (shared_ptr, vectors) are not kept alive by a consumed slot.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(T item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = std::move(item);
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = std::move(buffer[t]);
        buffer[t] = T{};
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() { return Size - 1; }

private:
    std::array<T, Size> buffer{};
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Bounded lock-free queue safe for any number of producers and consumers.
 *
 * Each cell carries a sequence number: a producer claims a position with a
 * CAS on head and publishes the cell by advancing its sequence, so two
 * producers never write the same cell. push() fails instead of waiting when
 * the queue is full.
 */
template<typename T, size_t Size>
class MultiProducerRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    MultiProducerRingBuffer() {
        for (size_t i = 0; i < Size; ++i) {
            cells[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MultiProducerRingBuffer(const MultiProducerRingBuffer&) = delete;
    MultiProducerRingBuffer& operator=(const MultiProducerRingBuffer&) = delete;

    bool push(T item) {
        Cell* cell = nullptr;
        size_t pos = head.load(std::memory_order_relaxed);
        while (true) {
            cell = &cells[pos & mask];
            const size_t seq = cell->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);
            if (diff == 0) {
                if (head.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return false; // Full
            } else {
                pos = head.load(std::memory_order_relaxed);
            }
        }

        cell->data = std::move(item);
        cell->sequence.store(pos + 1, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        Cell* cell = nullptr;
        size_t pos = tail.load(std::memory_order_relaxed);
        while (true) {
            cell = &cells[pos & mask];
            const size_t seq = cell->sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos + 1);
            if (diff == 0) {
                if (tail.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                return std::nullopt; // Empty
            } else {
                pos = tail.load(std::memory_order_relaxed);
            }
        }

        T item = std::move(cell->data);
        cell->data = T{};
        cell->sequence.store(pos + Size, std::memory_order_release);
        return item;
    }

    static constexpr size_t capacity() { return Size; }

private:
    struct Cell {
        std::atomic<size_t> sequence{0};
        T data{};
    };

    static constexpr size_t mask = Size - 1;
    std::array<Cell, Size> cells;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton Logger for Audio Thread telemetry.
 *
 * log_message() and log_event() may be called concurrently from any number
 * of threads (capture, playback, worker). Control threads drain the entries
 * with pop_entry() or flush().
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp_us = now_us();
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp_us = now_us();
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain all pending entries to a stream.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t written = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->timestamp_us << "us] [" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << '\n';
            ++written;
        }
        const uint64_t dropped = dropped_.exchange(0, std::memory_order_relaxed);
        if (dropped > 0) {
            out << "[AudioLogger] " << dropped << " entries dropped (ring full)\n";
        }
        out.flush();
        return written;
    }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    AudioLogger() = default;

    static uint64_t now_us() {
        using namespace std::chrono;
        return static_cast<uint64_t>(
            duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
    }

    MultiProducerRingBuffer<LogEntry, 1024> ring_buffer;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace megaphone
