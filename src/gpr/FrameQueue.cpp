#include "gpr/FrameQueue.hpp"
#include <stdexcept>

FrameQueue::FrameQueue(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) throw std::invalid_argument("Staging capacity must be positive");
}

bool FrameQueue::try_push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || frames_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

bool FrameQueue::pop(Frame& frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) return false;
    frame = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

uint64_t FrameQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
