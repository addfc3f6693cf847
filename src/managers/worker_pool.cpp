#include "worker_pool.hpp"
#include <core/log.hpp>
#include <exception>

WorkerPool::WorkerPool(std::size_t size) {
    if (size == 0) size = 1;
    workers_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    task_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [&] { return queue_.empty() && busy_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    task_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;   // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++busy_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            fleetrun_log(std::string("WorkerPool: task threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --busy_;
            if (queue_.empty() && busy_ == 0) idle_cv_.notify_all();
        }
    }
}
