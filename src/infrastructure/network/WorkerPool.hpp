#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mping::infra {

/**
 * @brief Fixed set of threads draining one asio::io_context.
 *
 * Tasks posted while the pool is stopped are refused, so callers waiting on
 * a task's result never wait on work that cannot run.
 */
class WorkerPool {
public:
    /**
     * @param threadCount Number of threads; zero is treated as one.
     * @param name Label used in log messages.
     */
    WorkerPool(std::size_t threadCount, std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    /**
     * @brief Joins all threads. Tasks still queued are destroyed without running.
     */
    void stop();

    /**
     * @brief Queues a task.
     * @return False if the pool is not running and the task was dropped.
     */
    template <typename Task>
    bool post(Task&& task) {
        if (!running_) {
            return false;
        }
        asio::post(io_, std::forward<Task>(task));
        return true;
    }

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] std::size_t threadCount() const { return threadCount_; }
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context io_;
    std::optional<WorkGuard> guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::size_t threadCount_;
    std::string name_;
};

} // namespace mping::infra
