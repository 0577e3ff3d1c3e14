#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of worker threads draining a FIFO of tasks.
// wait() blocks until every submitted task has finished.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(static_cast<size_t>(n_threads));
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    // Submit the same task once per worker thread. Used for cursor dispatch,
    // where each copy keeps claiming bands until the shared cursor runs out.
    void submit_per_worker(const std::function<void()>& f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (size_t i = 0; i < workers.size(); ++i) {
                ++pending;
                tasks.push_back(f);
            }
        }
        cv_task.notify_all();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
    }

private:
    void worker_loop()
    {
        for (;;) {
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
