#include "render_worker.hpp"
#include "thread_group.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Split [start, end) into row-rectangles and render each.
//
// A range that does not begin on a row boundary starts with a partial row,
// then covers as many full rows as fit, then ends with a partial row. Each
// piece carries the full image geometry; renderers map pixels against it.
// -----------------------------------------------------------------------
static void render_range(const ClaimedRange& r, uint8_t* base,
                         const ViewState& vs, IBandRenderer& renderer)
{
    const size_t W = static_cast<size_t>(vs.width);

    size_t pos = r.start;
    while (pos < r.end) {
        const int row = static_cast<int>(pos / W);
        const int col = static_cast<int>(pos % W);
        const size_t left = r.end - pos;

        int piece_w, piece_h;
        if (col != 0 || left < W) {
            piece_w = static_cast<int>(std::min(W - static_cast<size_t>(col), left));
            piece_h = 1;
        } else {
            piece_w = vs.width;
            piece_h = static_cast<int>(left / W);
        }

        BandView band;
        band.pixels      = base + pos;
        band.offset      = pos;
        band.width       = piece_w;
        band.height      = piece_h;
        band.upper_left  = pixel_to_point(vs.width, vs.height, col, row,
                                          vs.upper_left, vs.lower_right);
        band.lower_right = pixel_to_point(vs.width, vs.height,
                                          col + piece_w, row + piece_h,
                                          vs.upper_left, vs.lower_right);
        band.image       = vs;
        renderer.render_band(band);

        pos += static_cast<size_t>(piece_w) * static_cast<size_t>(piece_h);
    }
}

WorkerStats render_worker(WorkQueue& queue, PixelBuffer& buf,
                          const ViewState& vs, IBandRenderer& renderer)
{
    WorkerStats stats;
    while (const auto range = queue.claim_next()) {
        if (range->end > buf.pixels.size())
            throw std::out_of_range("render_worker: range ["
                                    + std::to_string(range->start) + ", "
                                    + std::to_string(range->end)
                                    + ") exceeds buffer of "
                                    + std::to_string(buf.pixels.size()));
        render_range(*range, buf.pixels.data(), vs, renderer);
        ++stats.ranges;
        stats.pixels += range->size();
    }
    return stats;
}

RenderReport render_parallel(const ViewState& vs, PixelBuffer& buf,
                             IBandRenderer& renderer,
                             int n_threads, size_t chunk_size)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    if (vs.width < 0 || vs.height < 0)
        throw std::invalid_argument("render_parallel: negative image size");
    buf.resize(vs.width, vs.height, 1);

    WorkQueue   queue(buf.pixels.size(), chunk_size);
    ThreadGroup group(n_threads);

    RenderReport report;
    report.chunk = chunk_size;
    report.workers.resize(static_cast<size_t>(n_threads));

    group.run([&](int i) {
        report.workers[static_cast<size_t>(i)] =
            render_worker(queue, buf, vs, renderer);
    });

    for (const auto& w : report.workers) {
        report.ranges += w.ranges;
        report.pixels += w.pixels;
    }
    report.ms = std::chrono::duration<double, std::milli>(
                    clock::now() - t0).count();
    return report;
}
