#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ql::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, lets running ones finish, joins workers. Idempotent.
    void stop();

    // Returns false once the pool is stopping.
    bool submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
