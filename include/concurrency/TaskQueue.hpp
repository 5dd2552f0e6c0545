#pragma once

#include "concurrency/Task.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rh::concurrency {

/**
 * Single-consumer FIFO. One worker thread pops a task, runs it to completion
 * and only then pops the next, so two tasks never overlap no matter how many
 * threads enqueue at once. The worker idles when the queue empties and picks
 * up again on the next enqueue.
 *
 * Exceptions escaping a task are logged and the queue keeps going.
 */
class TaskQueue {
public:
    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // false once shutdown() has been called.
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> fn, std::string label = "task");

    // True while a task runs or tasks are waiting.
    [[nodiscard]] bool isDraining() const;
    [[nodiscard]] size_t size() const;

    // Blocks until the queue is empty and no task is running. Must not be
    // called from inside a task.
    void waitIdle();

    // Runs whatever is already queued, rejects new work, joins the worker.
    void shutdown();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::deque<std::shared_ptr<Task>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
    bool running_ = false;
    bool stopFlag_ = false;
    std::thread worker_;
};

}
