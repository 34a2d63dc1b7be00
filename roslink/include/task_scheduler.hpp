#ifndef ROSLINK_TASK_SCHEDULER_HPP
#define ROSLINK_TASK_SCHEDULER_HPP

#include "thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace roslink {

// Worker pool plus a timer thread. Runs everything that must stay off the
// transport I/O thread: background ready callbacks, delayed calls and
// long-running action executors.
class TaskScheduler {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit TaskScheduler(size_t worker_count = 4);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Returns false once the scheduler has been stopped
    bool post(Task task);
    bool post_after(std::chrono::milliseconds delay, Task task);

    // Drops pending timers, lets queued tasks finish and joins all threads.
    // Called from one of our own tasks, that thread is left for the destructor
    // to join and tasks not yet started are dropped. A concurrent caller waits
    // until the first one is done.
    void stop();

    bool is_running() const { return running_; }
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_func();
    void timer_func();
    bool is_own_thread() const;
    void join_threads(bool detach_self);

    ThreadSafeQueue<Task> tasks_;
    std::vector<std::thread> workers_;
    std::thread timer_thread_;
    std::vector<std::thread::id> thread_ids_;
    std::atomic<bool> running_;
    bool stopped_ = false;

    std::mutex timer_mutex_;
    std::condition_variable timer_cond_;
    std::condition_variable stopped_cond_;
    std::multimap<Clock::time_point, Task> timers_;
};

} // namespace roslink

#endif // ROSLINK_TASK_SCHEDULER_HPP
