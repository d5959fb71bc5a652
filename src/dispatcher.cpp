#include "dispatcher.hpp"
#include <algorithm>
#include <iostream>

namespace dictate {

MainDispatcher::MainDispatcher()
    : owner_(std::this_thread::get_id()) {
}

bool MainDispatcher::on_dispatch_thread() const {
    return std::this_thread::get_id() == owner_;
}

void MainDispatcher::post(Task task) {
    if (on_dispatch_thread()) {
        task();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void MainDispatcher::post_after(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.push_back(Timer{std::chrono::steady_clock::now() + delay, timer_sequence_++, std::move(task)});
    }
    cv_.notify_one();
}

void MainDispatcher::quit() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
    }
    cv_.notify_one();
}

// Must be called from the thread that constructed the dispatcher
void MainDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!quit_) {
        auto now = std::chrono::steady_clock::now();

        // Move due timers to the task list, oldest first
        std::vector<Timer> due;
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->due <= now) {
                due.push_back(std::move(*it));
                it = timers_.erase(it);
            } else {
                ++it;
            }
        }
        std::sort(due.begin(), due.end(), [](const Timer& a, const Timer& b) {
            return a.due != b.due ? a.due < b.due : a.sequence < b.sequence;
        });
        for (auto& timer : due) {
            tasks_.push_back(std::move(timer.task));
        }

        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            task();
            lock.lock();
            continue;
        }

        if (timers_.empty()) {
            cv_.wait(lock);
        } else {
            auto next = std::min_element(timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
                return a.due < b.due;
            });
            cv_.wait_until(lock, next->due);
        }
    }
}

TaskQueue::TaskQueue() {
    worker_ = std::thread([this]() {
        worker_loop();
    });
}

TaskQueue::~TaskQueue() {
    shutdown();
}

void TaskQueue::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            std::cerr << "[dictate] Task submitted after shutdown, dropped" << std::endl;
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void TaskQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_one();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void TaskQueue::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                idle_cv_.notify_all();
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            busy_ = true;
        }
        task();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace dictate
