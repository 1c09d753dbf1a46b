#pragma once

/**
 * @file event_loop.h
 * @brief Single-threaded task queue driving the pipeline
 *
 * Every state change of the session client, detector and accumulator runs
 * on the thread that calls run_pending(). Other threads (channel reader,
 * HTTP workers) only post() tasks.
 */

#include "common.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace live_scribe {

class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop() = default;

    /// Joins background workers; tasks still queued are discarded
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task for the loop thread. Thread-safe.
    void post(Task task);

    /**
     * @brief Run blocking work on a background thread
     *
     * The work should post() its completion back to the loop. Workers are
     * joined when the loop is destroyed.
     */
    void spawn(Task work);

    /**
     * @brief Run tasks queued so far (not ones they post)
     * @return Number of tasks run
     */
    size_t run_pending();

    /// Block until a task is queued or the timeout elapses
    bool wait_for_task(Duration timeout);

    /**
     * @brief Run tasks until pred() holds or the timeout elapses
     * @return Final value of pred()
     */
    bool run_until(const std::function<bool()>& pred, Duration timeout);

    size_t pending() const;

    /// Background workers not yet finished
    size_t active_workers() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished_workers();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace live_scribe
