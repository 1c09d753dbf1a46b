#include "event_loop.h"
#include "logger.h"
#include <algorithm>
#include <exception>

namespace live_scribe {

EventLoop::~EventLoop() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty()) {
        Logger::debug("Event loop destroyed with " + std::to_string(tasks_.size()) + " pending tasks");
    }
    tasks_.clear();
}

void EventLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::spawn(Task work) {
    if (!work) return;
    reap_finished_workers();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([work = std::move(work), done]() {
        try {
            work();
        } catch (const std::exception& e) {
            Logger::error(std::string("Background task failed: ") + e.what());
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    for (auto& task : batch) {
        task();
    }

    reap_finished_workers();
    return batch.size();
}

bool EventLoop::wait_for_task(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); });
}

bool EventLoop::run_until(const std::function<bool()>& pred, Duration timeout) {
    auto deadline = Clock::now() + timeout;
    while (!pred()) {
        auto now = Clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<Duration>(deadline - now);
        if (wait_for_task(std::min(remaining, Duration(10)))) {
            run_pending();
        }
    }
    return pred();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t EventLoop::active_workers() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    size_t active = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load()) active++;
    }
    return active;
}

void EventLoop::reap_finished_workers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.splice(finished.end(), workers_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

} // namespace live_scribe
