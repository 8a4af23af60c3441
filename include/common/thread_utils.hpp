#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <vector>

// Thread helpers for fan-out work that must not occupy the request pool.
class ThreadUtils {
public:
    static void sleepFor(std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }

    template<typename Func, typename... Args>
    static std::future<typename std::result_of<Func(Args...)>::type>
    async(Func&& func, Args&&... args) {
        return std::async(std::launch::async,
                         std::forward<Func>(func),
                         std::forward<Args>(args)...);
    }

    // Runs func on every item, at most maxConcurrent at a time, and returns
    // the results in item order. Throws std::system_error when no thread can
    // be started.
    template<typename Item, typename Func>
    static auto mapConcurrently(const std::vector<Item>& items, Func func, size_t maxConcurrent)
        -> std::vector<typename std::result_of<Func(const Item&)>::type> {
        using result_type = typename std::result_of<Func(const Item&)>::type;

        if (maxConcurrent == 0) {
            maxConcurrent = 1;
        }

        std::vector<result_type> results;
        results.reserve(items.size());
        for (size_t begin = 0; begin < items.size(); begin += maxConcurrent) {
            const size_t end = std::min(items.size(), begin + maxConcurrent);
            std::vector<std::future<result_type>> pending;
            pending.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                pending.push_back(async(func, std::cref(items[i])));
            }
            for (auto& future : pending) {
                results.push_back(future.get());
            }
        }
        return results;
    }
};
