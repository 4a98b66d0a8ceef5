#include "placement_executor.H"

#include <stdexcept>

namespace keeper::orders {

void InlineExecutor::submit(std::function<void()> attempt) {
    attempt();
}

WorkerPoolExecutor::WorkerPoolExecutor(size_t num_workers, std::shared_ptr<spdlog::logger> logger)
    : logger(logger) {
    if (num_workers == 0) {
        throw std::invalid_argument("Worker pool needs at least one worker");
    }
    workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; i++) {
        workers.emplace_back([this, i]() { worker_loop(i); });
    }
    logger->info("Started placement worker pool with {} workers", num_workers);
}

WorkerPoolExecutor::~WorkerPoolExecutor() {
    shutdown();
}

void WorkerPoolExecutor::submit(std::function<void()> attempt) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw std::runtime_error("Placement worker pool is shut down");
        }
        queue.push_back(std::move(attempt));
    }
    queue_cv.notify_one();
}

void WorkerPoolExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_cv.wait(lock, [this]() { return queue.empty() && active == 0; });
}

void WorkerPoolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping && workers.empty()) {
            return;
        }
        stopping = true;
    }
    queue_cv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

void WorkerPoolExecutor::worker_loop(size_t worker_id) {
    while (true) {
        std::function<void()> attempt;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this]() { return stopping || !queue.empty(); });
            if (queue.empty()) {
                // stopping and drained
                return;
            }
            attempt = std::move(queue.front());
            queue.pop_front();
            active++;
        }

        try {
            attempt();
        } catch (const std::exception& e) {
            logger->error("Exception in placement worker {}: {}", worker_id, e.what());
        } catch (...) {
            logger->error("Unknown exception in placement worker {}", worker_id);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active--;
        }
        idle_cv.notify_all();
    }
}

std::unique_ptr<PlacementExecutor> make_placement_executor(size_t num_workers, std::shared_ptr<spdlog::logger> logger) {
    if (num_workers == 0) {
        return std::make_unique<InlineExecutor>();
    }
    return std::make_unique<WorkerPoolExecutor>(num_workers, logger);
}

} // namespace keeper::orders
