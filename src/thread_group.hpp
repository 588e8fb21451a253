#pragma once

#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

enum class GroupState {
    Created  = 0,
    Running  = 1,   // launch started, no thread has returned yet
    Draining = 2,   // at least one thread has returned
    Joined   = 3,   // every thread joined (terminal)
};

// Fixed-size group of threads whose lifetime is bounded by run(): every
// thread it starts has been joined by the time run() returns or throws, so
// anything the workers borrow only has to outlive the call.
//
// A worker that throws does not take the others down. Its exception is kept
// and the first one (lowest worker index) is rethrown after the join.
class ThreadGroup {
public:
    explicit ThreadGroup(int n_threads)
        : n(n_threads)
    {
        if (n_threads < 1)
            throw std::invalid_argument("ThreadGroup: need at least one thread");
    }

    ~ThreadGroup() { join_all(); }

    ThreadGroup(const ThreadGroup&)            = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    // Calls fn(worker_index) on n threads and blocks until all are joined.
    template <typename Fn>
    void run(Fn&& fn)
    {
        GroupState expected = GroupState::Created;
        if (!current.compare_exchange_strong(expected, GroupState::Running))
            throw std::logic_error("ThreadGroup: run() called twice");

        faults.assign(static_cast<size_t>(n), nullptr);
        workers.reserve(static_cast<size_t>(n));
        try {
            for (int i = 0; i < n; ++i)
                workers.emplace_back([this, &fn, i] { worker_main(fn, i); });
        } catch (const std::system_error&) {
            // Could not start every thread: still wait for the ones that did.
            join_all();
            throw;
        }

        join_all();
        for (const auto& f : faults)
            if (f) std::rethrow_exception(f);
    }

    GroupState state() const { return current.load(); }
    int        size()  const { return n; }

    // Number of workers that ended with an exception. Workers may still be
    // writing their slot before the join, so this reports 0 until Joined.
    int fault_count() const
    {
        if (current.load() != GroupState::Joined)
            return 0;
        int count = 0;
        for (const auto& f : faults)
            if (f) ++count;
        return count;
    }

private:
    template <typename Fn>
    void worker_main(Fn& fn, int index)
    {
        try {
            fn(index);
        } catch (...) {
            faults[static_cast<size_t>(index)] = std::current_exception();
        }
        GroupState expected = GroupState::Running;
        current.compare_exchange_strong(expected, GroupState::Draining);
    }

    void join_all()
    {
        for (auto& t : workers)
            if (t.joinable()) t.join();
        if (current.load() != GroupState::Created)
            current.store(GroupState::Joined);
    }

    const int                       n;
    std::vector<std::thread>        workers;
    std::vector<std::exception_ptr> faults;
    std::atomic<GroupState>         current{GroupState::Created};
};
