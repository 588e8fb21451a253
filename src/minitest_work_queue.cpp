// ============================================================================
//  minitest_work_queue - WorkQueue partitioning
//
//   [A] single-thread claims tile [0, total) in order, no gaps or overlap
//   [B] edge cases: empty queue, one chunk, chunk size 0, sticky exhaustion
//   [C] 100 / 30 yields [0,30) [30,60) [60,90) [90,100) for 1, 2, 8 threads
//   [D] many threads hammering one queue: same range set as one thread
//
//  Run: ./minitest_work_queue  (exit status 0 when all pass)
// ============================================================================

#include "work_queue.hpp"
#include "thread_group.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::fprintf(stderr, "[FAIL] %s:%d -> %s\n", __FUNCTION__, __LINE__, #expr); return false; } }while(0)

using Range = std::pair<size_t, size_t>;

static std::vector<Range> drain(WorkQueue& q)
{
    std::vector<Range> out;
    while (const auto r = q.claim_next())
        out.emplace_back(r->start, r->end);
    return out;
}

// Claims `q` empty from n_threads threads, returns every range sorted.
static std::vector<Range> drain_parallel(WorkQueue& q, int n_threads)
{
    std::vector<std::vector<Range>> per_thread(static_cast<size_t>(n_threads));
    ThreadGroup group(n_threads);
    group.run([&](int i) { per_thread[static_cast<size_t>(i)] = drain(q); });

    std::vector<Range> all;
    for (const auto& v : per_thread)
        all.insert(all.end(), v.begin(), v.end());
    std::sort(all.begin(), all.end());
    return all;
}

// Ranges sorted by start must be non-empty, contiguous from 0 to total.
static bool tiles_exactly(const std::vector<Range>& ranges, size_t total)
{
    size_t expect = 0;
    for (const auto& r : ranges) {
        if (r.first != expect || r.second <= r.first || r.second > total)
            return false;
        expect = r.second;
    }
    return expect == total;
}

// ------------------ TEST A : single-thread tiling ---------------------------
static bool test_single_thread_tiling()
{
    const size_t totals[] = {0, 1, 2, 7, 100, 1000, 1023, 4096};
    const size_t chunks[] = {1, 2, 3, 30, 100, 1000, 5000};

    for (size_t total : totals) {
        for (size_t chunk : chunks) {
            WorkQueue q(total, chunk);
            size_t expect_start = 0;
            size_t n = 0;
            while (const auto r = q.claim_next()) {
                T_ASSERT(r->start == expect_start);
                T_ASSERT(r->start < r->end);
                T_ASSERT(r->end <= total);
                T_ASSERT(r->size() == std::min(chunk, total - r->start));
                T_ASSERT(r->index == n);
                expect_start = r->end;
                ++n;
            }
            T_ASSERT(expect_start == total);
            T_ASSERT(n == q.range_count());
            T_ASSERT(q.exhausted());
        }
    }
    return true;
}

// ------------------ TEST B : edge cases -------------------------------------
static bool test_empty_queue()
{
    WorkQueue q(0, 16);
    T_ASSERT(q.exhausted());
    T_ASSERT(!q.claim_next());
    T_ASSERT(q.range_count() == 0);
    return true;
}

static bool test_chunk_covers_everything()
{
    const size_t cases[][2] = {{1, 1}, {10, 10}, {10, 11}, {999, 1000000}};
    for (const auto& c : cases) {
        WorkQueue q(c[0], c[1]);
        const auto r = q.claim_next();
        T_ASSERT(r);
        T_ASSERT(r->start == 0 && r->end == c[0]);
        T_ASSERT(!q.claim_next());
    }
    return true;
}

static bool test_zero_chunk_rejected()
{
    try {
        WorkQueue q(10, 0);
    } catch (const std::invalid_argument&) {
        return true;
    }
    T_ASSERT(!"WorkQueue(10, 0) did not throw");
    return false;
}

static bool test_exhaustion_is_sticky()
{
    WorkQueue q(5, 2);
    T_ASSERT(drain(q).size() == 3);
    for (int i = 0; i < 10; ++i)
        T_ASSERT(!q.claim_next());

    // From other threads too.
    const auto late = drain_parallel(q, 4);
    T_ASSERT(late.empty());
    return true;
}

// ------------------ TEST C : fixed scenario ---------------------------------
static bool test_hundred_by_thirty()
{
    const std::vector<Range> expected = {{0, 30}, {30, 60}, {60, 90}, {90, 100}};
    for (int threads : {1, 2, 8}) {
        WorkQueue q(100, 30);
        T_ASSERT(drain_parallel(q, threads) == expected);
    }
    return true;
}

// ------------------ TEST D : contention -------------------------------------
static bool test_contended_claims()
{
    const size_t total = 100000;
    for (size_t chunk : {size_t(1), size_t(3), size_t(64), size_t(4999)}) {
        WorkQueue single(total, chunk);
        const auto reference = drain(single);

        for (int threads : {2, 7, 16, 32}) {
            WorkQueue q(total, chunk);
            const auto got = drain_parallel(q, threads);
            T_ASSERT(tiles_exactly(got, total));
            T_ASSERT(got == reference);
        }
    }
    return true;
}

// Each index claimed by exactly one thread, checked per element.
static bool test_no_index_claimed_twice()
{
    const size_t total = 50000;
    WorkQueue q(total, 3);
    std::vector<int> owner(total, -1);
    std::mutex mtx;
    bool clash = false;

    ThreadGroup group(10);
    group.run([&](int t) {
        std::vector<Range> mine = drain(q);
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& r : mine)
            for (size_t i = r.first; i < r.second; ++i) {
                if (owner[i] != -1) clash = true;
                owner[i] = t;
            }
    });

    T_ASSERT(!clash);
    T_ASSERT(std::find(owner.begin(), owner.end(), -1) == owner.end());
    return true;
}

int main()
{
    bool ok = true;

    ok &= test_single_thread_tiling();
    std::printf("[A] single-thread tiling : %s\n", ok ? "OK" : "FAIL");

    ok &= test_empty_queue();
    ok &= test_chunk_covers_everything();
    ok &= test_zero_chunk_rejected();
    ok &= test_exhaustion_is_sticky();
    std::printf("[B] edge cases : %s\n", ok ? "OK" : "FAIL");

    ok &= test_hundred_by_thirty();
    std::printf("[C] 100 by 30 : %s\n", ok ? "OK" : "FAIL");

    ok &= test_contended_claims();
    ok &= test_no_index_claimed_twice();
    std::printf("[D] contention : %s\n", ok ? "OK" : "FAIL");

    std::printf("%s\n", ok ? "ALL TESTS PASSED" : "SOME TESTS FAILED");
    return ok ? 0 : 1;
}
