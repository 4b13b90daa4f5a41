#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of workers draining a FIFO of tasks. wait() blocks until every
// submitted task has finished.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        const int n = std::max(1, n_threads);
        workers.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    int size() const { return static_cast<int>(workers.size()); }

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
    }

    // Calls fn(begin, end) over [0, count) in slices of at most `chunk`, then
    // waits for all of them.
    template<typename Fn>
    void parallel_for(size_t count, size_t chunk, Fn fn)
    {
        if (chunk == 0) chunk = 1;
        for (size_t begin = 0; begin < count; begin += chunk) {
            const size_t end = std::min(count, begin + chunk);
            submit([fn, begin, end] { fn(begin, end); });
        }
        wait();
    }

private:
    void worker_loop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            task();
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (--pending == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::deque<std::function<void()>> tasks;
    std::mutex                        mtx;
    std::condition_variable           cv_task;
    std::condition_variable           cv_done;
    int                               pending  = 0;
    bool                              stopping = false;
};
