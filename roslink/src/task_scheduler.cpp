#include "task_scheduler.hpp"
#include "log.hpp"

namespace roslink {

TaskScheduler::TaskScheduler(size_t worker_count) : running_(true) {
    if (worker_count == 0) worker_count = 1;

    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskScheduler::worker_func, this);
    }
    timer_thread_ = std::thread(&TaskScheduler::timer_func, this);

    for (const auto& worker : workers_) {
        thread_ids_.push_back(worker.get_id());
    }
    thread_ids_.push_back(timer_thread_.get_id());
}

TaskScheduler::~TaskScheduler() {
    stop();
    join_threads(true);
}

bool TaskScheduler::post(Task task) {
    if (!running_) return false;
    return tasks_.push(std::move(task));
}

bool TaskScheduler::post_after(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (!running_) return false;
        timers_.emplace(Clock::now() + delay, std::move(task));
    }
    timer_cond_.notify_one();
    return true;
}

void TaskScheduler::stop() {
    {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        if (!running_) {
            // Our own threads cannot wait for a join that waits for them
            if (!is_own_thread()) {
                stopped_cond_.wait(lock, [this] { return stopped_; });
            }
            return;
        }
        running_ = false;
        timers_.clear();
    }
    timer_cond_.notify_all();
    tasks_.shutdown();

    join_threads(false);

    // Whatever is left would run after our owner is gone
    if (is_own_thread()) {
        if (const size_t dropped = tasks_.clear()) {
            ROSLINK_LOG_DEBUG("TaskScheduler") << "Dropped " << dropped << " queued tasks on stop";
        }
    }

    // Notified under the lock: a woken waiter may go on to destroy us
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stopped_ = true;
    stopped_cond_.notify_all();
}

bool TaskScheduler::is_own_thread() const {
    const auto self = std::this_thread::get_id();
    for (const auto& id : thread_ids_) {
        if (id == self) return true;
    }
    return false;
}

// The calling thread is skipped, or detached when detach_self is set
void TaskScheduler::join_threads(bool detach_self) {
    const auto self = std::this_thread::get_id();
    auto finish = [self, detach_self](std::thread& t) {
        if (!t.joinable()) return;
        if (t.get_id() != self) {
            t.join();
        } else if (detach_self) {
            t.detach();
        }
    };

    finish(timer_thread_);
    for (auto& worker : workers_) {
        finish(worker);
    }
}

void TaskScheduler::worker_func() {
    while (true) {
        Task task;
        try {
            task = tasks_.pop();
        } catch (const QueueShutdown&) {
            break;
        }

        try {
            task();
        } catch (const std::exception& e) {
            ROSLINK_LOG_ERROR("TaskScheduler") << "Task failed: " << e.what();
        }
    }
}

void TaskScheduler::timer_func() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (running_) {
        if (timers_.empty()) {
            timer_cond_.wait(lock, [this] { return !running_ || !timers_.empty(); });
            continue;
        }

        auto next = timers_.begin()->first;
        if (timer_cond_.wait_until(lock, next) == std::cv_status::no_timeout) {
            // Woken early: a sooner timer may have been added
            continue;
        }

        const auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first <= now) {
            tasks_.push(std::move(timers_.begin()->second));
            timers_.erase(timers_.begin());
        }
    }
}

} // namespace roslink
