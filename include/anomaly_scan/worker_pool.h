#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace anomaly_scan
{
    // Fixed-size pool of worker threads draining a FIFO task queue.
    // The destructor finishes every queued task, then joins.
    class WorkerPool
    {
    public:
        explicit WorkerPool(std::size_t threads);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        // Queue a callable; its result (or exception) arrives through the future
        template <typename F>
        auto submit(F &&func) -> std::future<std::invoke_result_t<std::decay_t<F>>>
        {
            using R = std::invoke_result_t<std::decay_t<F>>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
            std::future<R> fut = task->get_future();
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (stopping_)
                    throw std::runtime_error("WorkerPool: submit after shutdown");
                tasks_.emplace([task]() { (*task)(); });
            }
            cv_.notify_one();
            return fut;
        }

        std::size_t size() const { return workers_.size(); }

    private:
        void worker_loop();

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mtx_;
        std::condition_variable cv_;
        bool stopping_ = false;
    };

} // namespace anomaly_scan
