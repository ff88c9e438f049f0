#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>
#include "sgylib/Trace.hpp"

// Accumulates traces between ingestion and finalization. All access to the
// stored traces goes through one mutex; critical sections are a push or a swap.
class TraceBuffer {
public:
    // Stamps trace.sequence_index (1-based, no gaps) and stores it
    uint64_t append(Trace trace);
    // Everything appended so far, in append order; the buffer is left empty
    std::vector<Trace> drain();
    // Live trace count, may lag a concurrent append
    std::size_t count() const { return count_.load(std::memory_order_relaxed); }
    // Sequence indices handed out so far, not reset by drain()
    uint64_t total_appended() const;

private:
    mutable std::mutex mutex_;
    std::vector<Trace> traces_;
    uint64_t last_sequence_ = 0;
    std::atomic<std::size_t> count_{0};
};
