#pragma once

#include <functional>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>
#include <thread>
#include <cstdint>

namespace dictate {

// Execution context that owns user-visible state
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;

    // Run the task on the owning context (inline if already there)
    virtual void post(Task task) = 0;

    // Run the task on the owning context after `delay`
    virtual void post_after(std::chrono::milliseconds delay, Task task) = 0;
};

// Main-thread loop: App::run() drives it until quit()
class MainDispatcher : public Dispatcher {
public:
    MainDispatcher();

    void post(Task task) override;
    void post_after(std::chrono::milliseconds delay, Task task) override;

    // Blocks, running posted tasks and due timers, until quit() is called
    void run();
    void quit();

    bool on_dispatch_thread() const;

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        uint64_t sequence;
        Task task;
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::vector<Timer> timers_;
    uint64_t timer_sequence_ = 0;
    bool quit_ = false;
    const std::thread::id owner_;
};

// Serial background worker for conversion and subprocess work
class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void submit(Task task);

    // Blocks until nothing is queued or running
    void wait_idle();

    // Finish queued work and join the worker
    void shutdown();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> tasks_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace dictate
