#include "work_queue.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

WorkQueue::WorkQueue(size_t total_length, size_t chunk_size)
    : total(total_length)
    , chunk(chunk_size)
{
    if (chunk_size == 0)
        throw std::invalid_argument("WorkQueue: chunk size must be at least 1");
}

// -----------------------------------------------------------------------
// claim_next: load, bound-check, CAS, retry.
//
// A failed compare_exchange means another thread advanced the cursor in the
// meantime, so the retry loop is bounded by total / chunk successful claims.
// All cursor operations use the default seq_cst ordering.
// -----------------------------------------------------------------------
std::optional<ClaimedRange> WorkQueue::claim_next()
{
    size_t current = cursor.next.load();
    while (true) {
        if (current > total)
            throw std::logic_error("WorkQueue: cursor " + std::to_string(current)
                                   + " past total length " + std::to_string(total));
        if (current == total)
            return std::nullopt;

        const size_t end = current + std::min(chunk, total - current);

        // On failure `current` is reloaded with the value another thread wrote.
        if (cursor.next.compare_exchange_weak(current, end))
            return ClaimedRange{current, end, current / chunk};
    }
}
