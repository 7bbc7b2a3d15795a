#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <vector>

namespace mtfcast {

/// Progress callback signature
/// Args: completed_count, total_count
using TaskProgressCallback = std::function<void(int, int)>;

/// Fixed-size worker pool over an indexed batch of tasks.
class TaskExecutor {
public:
    using Task = std::function<void(size_t)>;

    /// @param num_threads Number of worker threads (0 = auto-detect)
    explicit TaskExecutor(int num_threads = 0);
    ~TaskExecutor();

    /// Runs task(i) for every i in [0, count) on the worker threads and joins them.
    /// A task that throws does not stop the others; once every worker has joined,
    /// the exception of the lowest failing index is rethrown.
    void ExecuteParallel(size_t count, const Task& task, TaskProgressCallback progress = nullptr);

    /// Same contract, in index order on the calling thread.
    void ExecuteSequential(size_t count, const Task& task, TaskProgressCallback progress = nullptr);

    int GetThreadCount() const { return m_numThreads; }

private:
    void WorkerThread(size_t count,
                      const Task& task,
                      std::vector<std::exception_ptr>& errors,
                      std::atomic<size_t>& nextTaskIndex,
                      std::atomic<int>& completedCount,
                      const TaskProgressCallback& progress);

    static void RethrowFirst(const std::vector<std::exception_ptr>& errors);

    int m_numThreads;
};

} // namespace mtfcast
