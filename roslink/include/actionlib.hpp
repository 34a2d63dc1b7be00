#ifndef ROSLINK_ACTIONLIB_HPP
#define ROSLINK_ACTIONLIB_HPP

#include "event_emitter.hpp"
#include "lifetime_guard.hpp"
#include "ros.hpp"
#include "topic.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace roslink {

using json = nlohmann::json;

// ============================================================================
// ACTIONLIB (topic-based actions: <server>/goal, /cancel, /status, /feedback, /result)
// ============================================================================

namespace action_events {
    constexpr const char* STATUS = "status";
    constexpr const char* FEEDBACK = "feedback";
    constexpr const char* RESULT = "result";
    constexpr const char* TIMEOUT = "timeout";
    constexpr const char* GOAL = "goal";
    constexpr const char* CANCEL = "cancel";
}

class ActionClient;

// One goal sent through an ActionClient. Emits "status", "feedback",
// "result" and "timeout". Once finished, later messages for it are ignored.
// Once its ActionClient is destroyed, send() and cancel() publish nothing.
class Goal : public std::enable_shared_from_this<Goal> {
    // Only ActionClient::add_goal creates goals
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using ResultCallback = std::function<void(const json&)>;

    Goal(PrivateTag, ActionClient& client, const json& goal);

    Goal(const Goal&) = delete;
    Goal& operator=(const Goal&) = delete;

    // Publishes the goal. With a non-zero timeout, "timeout" fires if no
    // result arrived in time; the goal itself is left running.
    void send(ResultCallback result_callback = nullptr,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    void cancel();

    // Blocks until finished and returns the result. Throws GoalTimeoutError.
    json wait();
    json wait(std::chrono::milliseconds timeout);

    // A result arrived and the status is no longer an active one
    bool is_finished() const;

    const std::string& goal_id() const { return goal_id_; }
    const json& goal_message() const { return goal_message_; }

    // Null until the first message of each kind
    json status() const;
    json feedback() const;
    json result() const;

    EventEmitter::Listener on(const std::string& event, EventEmitter::Callback cb) { return emitter_.on(event, std::move(cb)); }
    void off(const std::string& event, const EventEmitter::Listener& listener) { emitter_.off(event, listener); }

private:
    friend class ActionClient;

    void handle_status(const json& status);
    void handle_feedback(const json& feedback);
    void handle_result(const json& result);
    void trigger_timeout();
    bool finished_locked() const;

    Ros& ros_;
    std::function<void(const json&)> publish_goal_;
    std::function<void(const json&)> publish_cancel_;
    std::string goal_id_;
    json goal_message_;
    EventEmitter emitter_;

    mutable std::mutex mutex_;
    std::condition_variable finished_cond_;
    json status_;
    json feedback_;
    std::optional<json> result_;
};

struct ActionClientOptions {
    // Emit "timeout" on the client when no status arrives within this window; 0 disables
    std::chrono::milliseconds timeout{0};
    bool omit_feedback = false;
    bool omit_status = false;
    bool omit_result = false;
};

class ActionClient {
public:
    // server_name e.g. "/fibonacci", action_name e.g. "actionlib_tutorials/FibonacciAction"
    ActionClient(Ros& ros, const std::string& server_name, const std::string& action_name,
                 ActionClientOptions options = ActionClientOptions());
    ~ActionClient();

    ActionClient(const ActionClient&) = delete;
    ActionClient& operator=(const ActionClient&) = delete;

    // Creates and tracks a goal; nothing is sent until Goal::send
    std::shared_ptr<Goal> add_goal(const json& goal);

    // Cancels every goal on the server
    void cancel();

    // Unsubscribes and unadvertises all action topics
    void dispose();

    size_t goal_count() const;

    Ros& ros() { return ros_; }
    const std::string& server_name() const { return server_name_; }
    const std::string& action_name() const { return action_name_; }

    EventEmitter::Listener on(const std::string& event, EventEmitter::Callback cb) { return emitter_.on(event, std::move(cb)); }
    void off(const std::string& event, const EventEmitter::Listener& listener) { emitter_.off(event, listener); }

private:
    friend class Goal;

    std::shared_ptr<Goal> find_goal(const json& status);
    void on_status_message(const json& message);
    void on_feedback_message(const json& message);
    void on_result_message(const json& message);

    Ros& ros_;
    std::string server_name_;
    std::string action_name_;
    ActionClientOptions options_;
    EventEmitter emitter_;

    Topic feedback_listener_;
    Topic status_listener_;
    Topic result_listener_;
    Topic goal_topic_;
    Topic cancel_topic_;

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<Goal>> goals_;
    bool received_status_ = false;
    bool disposed_ = false;

    LifetimeGuard guard_;
    // Publishing for goals that outlive the client; kept apart from guard_
    // so a result callback can send the next goal
    LifetimeGuard goal_guard_;
};

// Action server handling one goal at a time. A goal arriving while another
// runs becomes the next goal and raises "cancel"; the executor notices
// through is_preempt_requested() and must finish with one of the set_*
// calls, after which the next goal starts.
class SimpleActionServer {
public:
    using ExecuteCallback = std::function<void(const json& goal)>;

    SimpleActionServer(Ros& ros, const std::string& server_name, const std::string& action_name);
    ~SimpleActionServer();

    SimpleActionServer(const SimpleActionServer&) = delete;
    SimpleActionServer& operator=(const SimpleActionServer&) = delete;

    // Runs execute on a scheduler worker for every goal that becomes current
    void start(ExecuteCallback execute);

    bool is_preempt_requested() const;

    void send_feedback(const json& feedback);
    void set_succeeded(const json& result);
    void set_aborted(const json& result);
    void set_preempted();

    // goal_id of the current goal, null when idle
    json current_goal_id() const;
    bool has_next_goal() const;

    EventEmitter::Listener on(const std::string& event, EventEmitter::Callback cb) { return emitter_.on(event, std::move(cb)); }
    void off(const std::string& event, const EventEmitter::Listener& listener) { emitter_.off(event, listener); }

private:
    void on_goal_message(const json& message);
    void on_cancel_message(const json& message);
    void finish_current(GoalStatus status, const json& result);
    void publish_status();
    void schedule_status();

    Ros& ros_;
    std::string server_name_;
    std::string action_name_;
    EventEmitter emitter_;

    Topic feedback_publisher_;
    Topic result_publisher_;
    Topic status_publisher_;
    Topic goal_listener_;
    Topic cancel_listener_;

    mutable std::mutex mutex_;
    std::optional<json> current_goal_;
    std::optional<json> next_goal_;
    bool preempt_request_ = false;
    json status_list_ = json::array();
    EventEmitter::Listener execute_listener_;

    LifetimeGuard guard_;
};

} // namespace roslink

#endif // ROSLINK_ACTIONLIB_HPP
