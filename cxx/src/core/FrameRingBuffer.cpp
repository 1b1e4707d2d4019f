#include "FrameRingBuffer.hpp"
#include <algorithm>
#include <mutex>

namespace megaphone {

FrameRingBuffer::FrameRingBuffer(size_t capacity, size_t frame_length)
    : capacity_(std::max<size_t>(capacity, 1))
    , frame_length_(frame_length)
    , storage_(std::max<size_t>(capacity, 1) * frame_length, 0)
{
}

void FrameRingBuffer::write_slot(size_t slot, std::span<const Sample> frame) {
    auto* dst = storage_.data() + slot * frame_length_;
    const size_t n = std::min(frame.size(), frame_length_);
    std::copy_n(frame.begin(), n, dst);
    std::fill(dst + n, dst + frame_length_, 0);
}

bool FrameRingBuffer::push(std::span<const Sample> frame) {
    std::lock_guard<SpinLock> guard(lock_);
    if (count_ == capacity_) {
        return false;
    }
    write_slot((head_ + count_) % capacity_, frame);
    ++count_;
    return true;
}

bool FrameRingBuffer::push_overwrite(std::span<const Sample> frame) {
    std::lock_guard<SpinLock> guard(lock_);
    bool dropped = false;
    if (count_ == capacity_) {
        head_ = (head_ + 1) % capacity_;
        --count_;
        dropped = true;
    }
    write_slot((head_ + count_) % capacity_, frame);
    ++count_;
    return dropped;
}

bool FrameRingBuffer::pop(std::span<Sample> out) {
    std::lock_guard<SpinLock> guard(lock_);
    if (count_ == 0) {
        return false;
    }
    const auto* src = storage_.data() + head_ * frame_length_;
    const size_t n = std::min(out.size(), frame_length_);
    std::copy_n(src, n, out.begin());
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(n), out.end(), 0);
    head_ = (head_ + 1) % capacity_;
    --count_;
    return true;
}

std::optional<std::vector<Sample>> FrameRingBuffer::pop() {
    std::vector<Sample> frame(frame_length_, 0);
    if (!pop(std::span<Sample>(frame))) {
        return std::nullopt;
    }
    return frame;
}

void FrameRingBuffer::clear() {
    std::lock_guard<SpinLock> guard(lock_);
    head_ = 0;
    count_ = 0;
}

size_t FrameRingBuffer::size() const {
    std::lock_guard<SpinLock> guard(lock_);
    return count_;
}

} // namespace megaphone
