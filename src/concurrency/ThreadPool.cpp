#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

using namespace ql::concurrency;
using namespace ql::logging;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }

    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) return false;
        queue.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] { return stopFlag.load() || !queue.empty(); });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::quicklink()->error("[ThreadPool] Task '{}' threw: {}", task->name(), e.what());
            }
        }
    });
}
