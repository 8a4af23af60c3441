#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t currentQueueSize{0};
};

// Fixed-size worker pool. Tasks start in submission order. Exceptions thrown
// by a task are stored in the returned future.
class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    template<typename F, typename... Args>
    auto addTask(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    // Blocks until the queue is empty and no worker is running a task.
    void waitForAll();

    size_t getActiveThreadCount() const;
    TaskStats getStats() const;

private:
    void workerThread();
    void stop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool stop_;

    mutable std::mutex statsMutex_;
    TaskStats stats_;
    std::atomic<size_t> activeTasks_{0};
};

template<typename F, typename... Args>
auto ParallelTaskManager::addTask(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        {
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.totalTasks++;
            stats_.currentQueueSize++;
        }
        tasks_.push([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}
