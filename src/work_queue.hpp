#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

// First unclaimed index of a WorkQueue. Only loaded and compare-exchanged;
// never decreases and never passes the queue's total length.
struct RangeCursor {
    std::atomic<size_t> next{0};
};

// Half-open index range [start, end) handed to exactly one worker.
struct ClaimedRange {
    size_t start = 0;
    size_t end   = 0;
    size_t index = 0;   // ordinal of the range: start / chunk_size

    size_t size() const { return end - start; }
};

// Lock-free partitioning of [0, total_length) into chunk_size-sized ranges.
// claim_next() may be called from any number of threads without external
// synchronization; the ranges it returns tile the index space exactly once.
//
// The queue hands out indices only. Whoever owns the buffer derives a view
// from them.
class WorkQueue {
public:
    // Throws std::invalid_argument if chunk_size is 0.
    WorkQueue(size_t total_length, size_t chunk_size);

    WorkQueue(const WorkQueue&)            = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Next unclaimed range, or std::nullopt once the queue is exhausted.
    // Exhaustion is sticky: every later call from any thread also returns
    // std::nullopt.
    std::optional<ClaimedRange> claim_next();

    size_t total_length() const { return total; }
    size_t chunk_size()   const { return chunk; }

    // Number of non-empty ranges the queue produces over its lifetime.
    size_t range_count() const { return (total + chunk - 1) / chunk; }

    // Snapshot; may be stale by the time the caller looks at it.
    bool exhausted() const { return cursor.next.load() >= total; }

private:
    const size_t total;
    const size_t chunk;
    RangeCursor  cursor;
};
