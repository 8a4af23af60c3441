#include "common/parallel_task_manager.hpp"

ParallelTaskManager::ParallelTaskManager(size_t numThreads)
    : stop_(false)
    , activeTasks_(0) {
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
    }
    if (numThreads == 0) {
        numThreads = 1;
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    waitForAll();
    stop();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        std::function<void()> taskFunc;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            taskFunc = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.currentQueueSize--;
        }

        // packaged_task captures anything the callable throws
        taskFunc();

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.completedTasks++;
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

size_t ParallelTaskManager::getActiveThreadCount() const {
    return workers_.size();
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}
