#include "WorkerPool.hpp"
#include <spdlog/spdlog.h>

namespace mcpd {

WorkerPool::WorkerPool(unsigned int num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (unsigned int i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("Worker pool '{}' started with {} threads", name_, num_threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::debug("Worker pool '{}' stopped", name_);
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace mcpd
