#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace mcpd {

/**
 * @brief Fixed-size pool of worker threads
 *
 * Futures returned by submit() come from packaged tasks, so dropping one
 * never blocks; the task still runs to completion on its worker.
 */
class WorkerPool {
public:
    /**
     * @param num_threads Number of worker threads (at least one)
     * @param name Label used in log messages
     */
    explicit WorkerPool(unsigned int num_threads, std::string name = "workers");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task
     * @throws std::runtime_error once the pool is shutting down
     */
    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using result_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
        std::future<result_type> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Worker pool '" + name_ + "' stopped, cannot add task");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    /**
     * @brief Drain queued tasks and join all workers (idempotent)
     */
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace mcpd
