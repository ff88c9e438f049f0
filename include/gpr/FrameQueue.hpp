#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include "gpr/Frame.hpp"

// Bounded staging queue between the frame source and the ingest worker.
// When full, the incoming (newest) frame is dropped so the source never blocks.
class FrameQueue {
public:
    explicit FrameQueue(std::size_t capacity);

    // false if the frame was dropped (queue full or closed)
    bool try_push(Frame frame);
    // Blocks until a frame is available. Returns false once the queue is
    // closed and empty.
    bool pop(Frame& frame);
    // Wakes the consumer; frames already queued can still be popped
    void close();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    uint64_t dropped() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};
