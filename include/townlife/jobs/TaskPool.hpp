#pragma once
// include/townlife/jobs/TaskPool.hpp
//
// Thin wrapper over a taskflow executor. Owned by the engine; no singleton.

#include <taskflow/taskflow.hpp>   // tf::Executor

#include <cstddef>
#include <thread>
#include <utility>

namespace townlife::jobs {

class TaskPool {
public:
    explicit TaskPool(std::size_t workers = DefaultWorkers()) : _executor(workers) {}

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    ~TaskPool() { _executor.wait_for_all(); }

    // Fire-and-forget. The callable must not let exceptions escape.
    template <typename F>
    void Post(F&& f) {
        _executor.silent_async(std::forward<F>(f));
    }

    // Wait for all outstanding work. Do not call from inside a task.
    void WaitAll() { _executor.wait_for_all(); }

    std::size_t Workers() const noexcept { return _executor.num_workers(); }

    static std::size_t DefaultWorkers() noexcept {
        const unsigned hc = std::thread::hardware_concurrency();
        return hc > 1 ? hc - 1 : 1;
    }

private:
    tf::Executor _executor;
};

} // namespace townlife::jobs
