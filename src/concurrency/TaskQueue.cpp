#include "concurrency/TaskQueue.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace rh::concurrency;
using namespace rh::log;

TaskQueue::TaskQueue(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread([this] { run(); });
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::shared_ptr<Task> task) {
    if (!task) return false;

    {
        std::scoped_lock lock(mutex_);
        if (stopFlag_) {
            Registry::queue()->warn("[TaskQueue:{}] Rejected '{}' after shutdown", name_, task->name());
            return false;
        }
        queue_.push_back(std::move(task));
    }

    workCv_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> fn, std::string label) {
    return enqueue(std::make_shared<FunctionTask>(std::move(fn), std::move(label)));
}

bool TaskQueue::isDraining() const {
    std::scoped_lock lock(mutex_);
    return running_ || !queue_.empty();
}

size_t TaskQueue::size() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

void TaskQueue::waitIdle() {
    if (std::this_thread::get_id() == worker_.get_id())
        throw std::logic_error("TaskQueue::waitIdle() called from inside a task on queue " + name_);

    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return !running_ && queue_.empty(); });
}

void TaskQueue::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopFlag_ && !worker_.joinable()) return;
        stopFlag_ = true;
    }
    workCv_.notify_all();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void TaskQueue::run() {
    while (true) {
        std::shared_ptr<Task> task;

        {
            std::unique_lock lock(mutex_);
            workCv_.wait(lock, [this] { return stopFlag_ || !queue_.empty(); });

            if (queue_.empty()) {
                // only reachable once stopFlag_ is set
                idleCv_.notify_all();
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
            running_ = true;
        }

        try {
            (*task)();
        } catch (const std::exception& e) {
            Registry::queue()->error("[TaskQueue:{}] Task '{}' failed: {}", name_, task->name(), e.what());
        } catch (...) {
            Registry::queue()->error("[TaskQueue:{}] Task '{}' failed: unknown exception", name_, task->name());
        }

        {
            std::scoped_lock lock(mutex_);
            running_ = false;
            if (queue_.empty()) idleCv_.notify_all();
        }
    }
}
