#include "infrastructure/network/WorkerPool.hpp"

#include <spdlog/spdlog.h>

namespace mping::infra {

WorkerPool::WorkerPool(std::size_t threadCount, std::string name)
    : threadCount_(threadCount == 0 ? 1 : threadCount), name_(std::move(name)) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) {
        return;
    }

    guard_.emplace(asio::make_work_guard(io_));
    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this]() { io_.run(); });
    }

    spdlog::debug("Worker pool '{}' started {} threads", name_, threadCount_);
}

void WorkerPool::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    guard_.reset();
    io_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    spdlog::debug("Worker pool '{}' stopped", name_);
}

} // namespace mping::infra
