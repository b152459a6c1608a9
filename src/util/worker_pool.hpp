#pragma once

#include <utility>

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

namespace parley {

// Task arena plus the task group that tracks every task enqueued into it,
// so shutdown can wait for queued work before the objects it uses go away.
class WorkerPool {
public:
    explicit WorkerPool(int threads) : arena_(threads, 0) {}

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Never blocks the caller.
    template <typename F>
    void enqueue(F&& f) {
        arena_.enqueue(group_.defer(std::forward<F>(f)));
    }

    // Block until every enqueued task, including tasks enqueued by those
    // tasks, has finished.
    void wait() {
        arena_.execute([this] { group_.wait(); });
    }

private:
    tbb::task_arena arena_;
    tbb::task_group group_;
};

} // namespace parley
