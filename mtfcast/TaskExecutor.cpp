#include "TaskExecutor.h"

#include <algorithm>
#include <thread>

namespace mtfcast {

TaskExecutor::TaskExecutor(int num_threads)
    : m_numThreads(num_threads)
{
    if (m_numThreads <= 0) {
        m_numThreads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

TaskExecutor::~TaskExecutor() = default;

void TaskExecutor::ExecuteParallel(size_t count, const Task& task, TaskProgressCallback progress) {
    if (count == 0) {
        return;
    }
    if (m_numThreads == 1 || count == 1) {
        ExecuteSequential(count, task, std::move(progress));
        return;
    }

    std::vector<std::exception_ptr> errors(count);
    std::atomic<size_t> nextTaskIndex{0};
    std::atomic<int> completedCount{0};

    const size_t threadCount = std::min(count, static_cast<size_t>(m_numThreads));
    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([&]() {
            WorkerThread(count, task, errors, nextTaskIndex, completedCount, progress);
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    RethrowFirst(errors);
}

void TaskExecutor::ExecuteSequential(size_t count, const Task& task, TaskProgressCallback progress) {
    std::vector<std::exception_ptr> errors(count);
    for (size_t i = 0; i < count; ++i) {
        try {
            task(i);
        } catch (...) {
            errors[i] = std::current_exception();
        }
        if (progress) {
            progress(static_cast<int>(i + 1), static_cast<int>(count));
        }
    }
    RethrowFirst(errors);
}

void TaskExecutor::WorkerThread(size_t count,
                                const Task& task,
                                std::vector<std::exception_ptr>& errors,
                                std::atomic<size_t>& nextTaskIndex,
                                std::atomic<int>& completedCount,
                                const TaskProgressCallback& progress) {
    while (true) {
        size_t taskIdx = nextTaskIndex.fetch_add(1);
        if (taskIdx >= count) {
            break;
        }

        // Each slot is written by exactly one worker.
        try {
            task(taskIdx);
        } catch (...) {
            errors[taskIdx] = std::current_exception();
        }

        int completed = completedCount.fetch_add(1) + 1;
        if (progress) {
            progress(completed, static_cast<int>(count));
        }
    }
}

void TaskExecutor::RethrowFirst(const std::vector<std::exception_ptr>& errors) {
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

} // namespace mtfcast
