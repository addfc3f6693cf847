#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed number of worker threads draining one FIFO task queue. Bounds the
// concurrency of host dispatch and traffic probing alike.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(std::size_t size);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task task);

    // Block until the queue is empty and no task is running.
    void wait_idle();

    // Finish queued tasks, then join the workers. Idempotent.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;
    std::size_t busy_ = 0;
    bool stopping_ = false;

    void worker_loop();
};
