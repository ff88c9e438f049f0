#include "gpr/TraceBuffer.hpp"

uint64_t TraceBuffer::append(Trace trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    trace.sequence_index = ++last_sequence_;
    traces_.push_back(std::move(trace));
    count_.store(traces_.size(), std::memory_order_relaxed);
    return last_sequence_;
}

std::vector<Trace> TraceBuffer::drain() {
    std::vector<Trace> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.swap(traces_);
        count_.store(0, std::memory_order_relaxed);
    }
    return out;
}

uint64_t TraceBuffer::total_appended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}
