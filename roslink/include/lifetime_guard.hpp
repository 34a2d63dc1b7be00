#ifndef ROSLINK_LIFETIME_GUARD_HPP
#define ROSLINK_LIFETIME_GUARD_HPP

#include <memory>
#include <mutex>
#include <utility>

namespace roslink {

// Ties deferred tasks and event listeners to the lifetime of their owner. A
// wrapped callable becomes a no-op once expire() has returned, and expire()
// waits for a running one to finish. A wrapped callable must not destroy its
// own owner, nor re-enter another callable wrapped by the same guard.
class LifetimeGuard {
public:
    LifetimeGuard() : state_(std::make_shared<State>()) {}
    ~LifetimeGuard() { expire(); }

    LifetimeGuard(const LifetimeGuard&) = delete;
    LifetimeGuard& operator=(const LifetimeGuard&) = delete;

    void expire() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->alive = false;
    }

    // The returned callable forwards its arguments to task while the owner lives
    template<typename Task>
    auto wrap(Task task) const {
        std::shared_ptr<State> state = state_;
        return [state, task = std::move(task)](auto&&... args) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->alive) task(std::forward<decltype(args)>(args)...);
        };
    }

private:
    struct State {
        std::mutex mutex;
        bool alive = true;
    };

    std::shared_ptr<State> state_;
};

} // namespace roslink

#endif // ROSLINK_LIFETIME_GUARD_HPP
