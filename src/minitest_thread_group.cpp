// ============================================================================
//  minitest_thread_group - structured thread group lifecycle
//
//   [A] every worker index runs exactly once; state Created -> Joined
//   [B] Running -> Draining once the first worker returns
//   [C] worker faults surface at the join point, after all workers finished
//   [D] misuse: zero threads, run() twice
//
//  Run: ./minitest_thread_group  (exit status 0 when all pass)
// ============================================================================

#include "thread_group.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::fprintf(stderr, "[FAIL] %s:%d -> %s\n", __FUNCTION__, __LINE__, #expr); return false; } }while(0)

// ------------------ TEST A : lifecycle --------------------------------------
static bool test_every_index_runs_once()
{
    for (int n : {1, 2, 5, 16}) {
        std::vector<std::atomic<int>> runs(static_cast<size_t>(n));
        for (auto& r : runs) r.store(0);

        ThreadGroup group(n);
        T_ASSERT(group.size() == n);
        T_ASSERT(group.state() == GroupState::Created);

        group.run([&](int i) { runs[static_cast<size_t>(i)].fetch_add(1); });

        T_ASSERT(group.state() == GroupState::Joined);
        T_ASSERT(group.fault_count() == 0);
        for (auto& r : runs)
            T_ASSERT(r.load() == 1);
    }
    return true;
}

// Plain (non-atomic) writes made by workers are visible after run().
static bool test_writes_visible_after_join()
{
    std::vector<int> data(8 * 1000, 0);
    ThreadGroup group(8);
    group.run([&](int i) {
        for (int k = 0; k < 1000; ++k)
            data[static_cast<size_t>(i * 1000 + k)] = i + 1;
    });
    for (size_t k = 0; k < data.size(); ++k)
        T_ASSERT(data[k] == static_cast<int>(k / 1000) + 1);
    return true;
}

// ------------------ TEST B : draining ---------------------------------------
static bool test_draining_after_first_return()
{
    const int n = 4;
    ThreadGroup group(n);
    std::atomic<int>  arrived{0};
    std::atomic<bool> first_saw_running{false};
    std::atomic<int>  others_saw_draining{0};

    group.run([&](int i) {
        arrived.fetch_add(1);
        while (arrived.load() < n) std::this_thread::yield();

        if (i == 0) {
            // Nobody has returned yet: the others wait for Draining below.
            first_saw_running = group.state() == GroupState::Running;
            return;
        }
        while (group.state() == GroupState::Running) std::this_thread::yield();
        if (group.state() == GroupState::Draining)
            others_saw_draining.fetch_add(1);
    });

    T_ASSERT(first_saw_running.load());
    T_ASSERT(others_saw_draining.load() == n - 1);
    T_ASSERT(group.state() == GroupState::Joined);
    return true;
}

// ------------------ TEST C : faults -----------------------------------------
static bool test_fault_rethrown_after_join()
{
    const int n = 6;
    std::atomic<int>  finished{0};
    std::atomic<bool> counted_early{false};
    ThreadGroup group(n);

    bool caught = false;
    try {
        group.run([&](int i) {
            if (i == 2) throw std::runtime_error("worker 2 failed");
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            // Fault slots are still being written: nothing is counted yet.
            if (group.fault_count() != 0) counted_early = true;
            finished.fetch_add(1);
        });
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "worker 2 failed";
    }

    T_ASSERT(caught);
    T_ASSERT(finished.load() == n - 1);   // the healthy workers ran to completion
    T_ASSERT(!counted_early.load());
    T_ASSERT(group.state() == GroupState::Joined);
    T_ASSERT(group.fault_count() == 1);
    return true;
}

static bool test_lowest_index_fault_wins()
{
    ThreadGroup group(5);
    std::string what;
    try {
        group.run([&](int i) {
            if (i == 3) throw std::runtime_error("three");
            if (i == 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                throw std::logic_error("one");
            }
        });
    } catch (const std::exception& e) {
        what = e.what();
    }
    T_ASSERT(what == "one");
    T_ASSERT(group.fault_count() == 2);
    return true;
}

// ------------------ TEST D : misuse -----------------------------------------
static bool test_zero_threads_rejected()
{
    for (int n : {0, -3}) {
        bool threw = false;
        try {
            ThreadGroup group(n);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        T_ASSERT(threw);
    }
    return true;
}

static bool test_run_twice_rejected()
{
    ThreadGroup group(2);
    group.run([](int) {});
    bool threw = false;
    try {
        group.run([](int) {});
    } catch (const std::logic_error&) {
        threw = true;
    }
    T_ASSERT(threw);
    T_ASSERT(group.state() == GroupState::Joined);
    return true;
}

int main()
{
    bool ok = true;

    ok &= test_every_index_runs_once();
    ok &= test_writes_visible_after_join();
    std::printf("[A] lifecycle : %s\n", ok ? "OK" : "FAIL");

    ok &= test_draining_after_first_return();
    std::printf("[B] draining : %s\n", ok ? "OK" : "FAIL");

    ok &= test_fault_rethrown_after_join();
    ok &= test_lowest_index_fault_wins();
    std::printf("[C] faults : %s\n", ok ? "OK" : "FAIL");

    ok &= test_zero_threads_rejected();
    ok &= test_run_twice_rejected();
    std::printf("[D] misuse : %s\n", ok ? "OK" : "FAIL");

    std::printf("%s\n", ok ? "ALL TESTS PASSED" : "SOME TESTS FAILED");
    return ok ? 0 : 1;
}
