// src/worker_pool.cpp
#include "anomaly_scan/worker_pool.h"

namespace anomaly_scan
{
    WorkerPool::WorkerPool(std::size_t threads)
    {
        if (threads == 0)
            threads = 1;
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this]() { worker_loop(); });
    }

    WorkerPool::~WorkerPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto &t : workers_)
        {
            if (t.joinable()) t.join();
        }
    }

    void WorkerPool::worker_loop()
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty())
                    return; // stopping and drained
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            // packaged_task stores any exception in its future
            task();
        }
    }

} // namespace anomaly_scan
