#pragma once

#include "renderer.hpp"
#include "view_state.hpp"
#include "work_queue.hpp"

#include <cstddef>
#include <vector>

struct WorkerStats {
    size_t ranges = 0;
    size_t pixels = 0;
};

struct RenderReport {
    std::vector<WorkerStats> workers;   // one entry per thread, by index
    size_t                   ranges = 0;
    size_t                   pixels = 0;
    size_t                   chunk  = 0;
    double                   ms     = 0.0;
};

// Worker loop: claims ranges until the queue runs dry and renders each one
// through `renderer`. The view for a range is built here from the claimed
// indices; the queue never sees the buffer.
//
// Throws std::out_of_range if the queue hands out an index beyond the
// buffer, and lets whatever the renderer throws escape.
WorkerStats render_worker(WorkQueue& queue, PixelBuffer& buf,
                          const ViewState& vs, IBandRenderer& renderer);

// Renders vs into buf (resized to vs.width x vs.height, one channel) with
// n_threads workers sharing one WorkQueue of chunk_size-pixel ranges.
// Returns after every worker has been joined; rethrows the first worker
// fault.
RenderReport render_parallel(const ViewState& vs, PixelBuffer& buf,
                             IBandRenderer& renderer,
                             int n_threads, size_t chunk_size);
