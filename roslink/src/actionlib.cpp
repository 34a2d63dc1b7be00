#include "actionlib.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <random>
#include <stdexcept>
#include <sstream>

namespace roslink {

namespace {

const char* const GOAL_STATUS_ARRAY = "actionlib_msgs/GoalStatusArray";
const char* const GOAL_ID = "actionlib_msgs/GoalID";

std::string generate_goal_id() {
    static std::mt19937_64 engine{std::random_device{}()};
    static std::mutex engine_mutex;

    double r;
    {
        std::lock_guard<std::mutex> lock(engine_mutex);
        r = std::uniform_real_distribution<double>(0.0, 1.0)(engine);
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream id;
    id << "goal_" << r << "_" << ms;
    return id.str();
}

// goal_id.id of an actionlib_msgs/GoalStatus, empty when absent
std::string status_goal_id(const json& status) {
    if (!status.is_object()) return {};
    auto goal_id = status.find("goal_id");
    if (goal_id == status.end() || !goal_id->is_object()) return {};
    auto id = goal_id->find("id");
    if (id == goal_id->end() || !id->is_string()) return {};
    return id->get<std::string>();
}

struct Stamp {
    int64_t secs = 0;
    int64_t nsecs = 0;

    bool is_zero() const { return secs == 0 && nsecs == 0; }

    bool operator<=(const Stamp& other) const {
        return secs < other.secs || (secs == other.secs && nsecs <= other.nsecs);
    }
};

Stamp read_stamp(const json& stamp) {
    Stamp s;
    if (stamp.is_object()) {
        s.secs = stamp.value("secs", int64_t(0));
        s.nsecs = stamp.value("nsecs", int64_t(0));
    }
    return s;
}

Stamp goal_stamp(const json& goal_message) {
    auto goal_id = goal_message.find("goal_id");
    if (goal_id == goal_message.end() || !goal_id->is_object()) return {};
    return read_stamp(goal_id->value("stamp", json::object()));
}

json now_stamp() {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return {{"secs", ns / 1000000000}, {"nsecs", ns % 1000000000}};
}

} // namespace

// ============================================================================
// GOAL
// ============================================================================

Goal::Goal(PrivateTag, ActionClient& client, const json& goal)
    : ros_(client.ros()),
      publish_goal_(client.goal_guard_.wrap([&client](const json& message) { client.goal_topic_.publish(message); })),
      publish_cancel_(client.goal_guard_.wrap([&client](const json& message) { client.cancel_topic_.publish(message); })),
      goal_id_(generate_goal_id()) {
    goal_message_ = {
        {"goal_id", {{"stamp", {{"secs", 0}, {"nsecs", 0}}}, {"id", goal_id_}}},
        {"goal", goal.is_null() ? json::object() : goal},
    };
}

void Goal::send(ResultCallback result_callback, std::chrono::milliseconds timeout) {
    if (result_callback) {
        emitter_.on(action_events::RESULT, std::move(result_callback));
    }

    publish_goal_(goal_message_);

    if (timeout.count() > 0) {
        std::weak_ptr<Goal> weak = weak_from_this();
        ros_.call_later(timeout, [weak] {
            if (auto goal = weak.lock()) goal->trigger_timeout();
        });
    }
}

void Goal::cancel() {
    publish_cancel_({{"stamp", {{"secs", 0}, {"nsecs", 0}}}, {"id", goal_id_}});
}

json Goal::wait() {
    if (ros_.is_io_thread()) {
        throw RosBridgeError("Goal::wait called from the transport thread");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    finished_cond_.wait(lock, [this] { return finished_locked(); });
    return *result_;
}

json Goal::wait(std::chrono::milliseconds timeout) {
    if (ros_.is_io_thread()) {
        throw RosBridgeError("Goal::wait called from the transport thread");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!finished_cond_.wait_for(lock, timeout, [this] { return finished_locked(); })) {
        throw GoalTimeoutError(goal_id_);
    }
    return *result_;
}

bool Goal::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_locked();
}

bool Goal::finished_locked() const {
    if (!result_) return false;
    if (!status_.is_object()) return true;
    return !is_active_status(status_.value("status", 0));
}

json Goal::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

json Goal::feedback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return feedback_;
}

json Goal::result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_ ? *result_ : json();
}

void Goal::handle_status(const json& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_locked()) return;
        status_ = status;
    }
    emitter_.emit(action_events::STATUS, status);
}

void Goal::handle_feedback(const json& feedback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_locked()) return;
        feedback_ = feedback;
    }
    emitter_.emit(action_events::FEEDBACK, feedback);
}

void Goal::handle_result(const json& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_locked()) return;
        result_ = result;
    }
    finished_cond_.notify_all();
    emitter_.emit(action_events::RESULT, result);
}

void Goal::trigger_timeout() {
    if (is_finished()) return;

    ROSLINK_LOG_WARN("ActionClient") << "Goal " << goal_id_ << " timed out";
    emitter_.emit(action_events::TIMEOUT);
}

// ============================================================================
// ACTION CLIENT
// ============================================================================

ActionClient::ActionClient(Ros& ros, const std::string& server_name, const std::string& action_name,
                           ActionClientOptions options)
    : ros_(ros),
      server_name_(server_name),
      action_name_(action_name),
      options_(options),
      feedback_listener_(ros, server_name + "/feedback", action_name + "Feedback"),
      status_listener_(ros, server_name + "/status", GOAL_STATUS_ARRAY),
      result_listener_(ros, server_name + "/result", action_name + "Result"),
      goal_topic_(ros, server_name + "/goal", action_name + "Goal"),
      cancel_topic_(ros, server_name + "/cancel", GOAL_ID) {

    goal_topic_.advertise();
    cancel_topic_.advertise();

    if (!options_.omit_status) {
        status_listener_.subscribe(guard_.wrap([this](const json& message) { on_status_message(message); }));
    }
    if (!options_.omit_feedback) {
        feedback_listener_.subscribe(guard_.wrap([this](const json& message) { on_feedback_message(message); }));
    }
    if (!options_.omit_result) {
        result_listener_.subscribe(guard_.wrap([this](const json& message) { on_result_message(message); }));
    }

    if (options_.timeout.count() > 0) {
        ros_.call_later(options_.timeout, guard_.wrap([this] {
            bool received;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                received = received_status_;
            }
            if (!received) {
                ROSLINK_LOG_WARN("ActionClient") << "No status from " << server_name_ << " within "
                                                 << options_.timeout.count() << " ms";
                emitter_.emit(action_events::TIMEOUT);
            }
        }));
    }
}

ActionClient::~ActionClient() {
    guard_.expire();
    goal_guard_.expire();
    dispose();
}

std::shared_ptr<Goal> ActionClient::add_goal(const json& goal) {
    auto created = std::make_shared<Goal>(Goal::PrivateTag(), *this, goal);

    std::lock_guard<std::mutex> lock(mutex_);
    goals_[created->goal_id()] = created;
    return created;
}

void ActionClient::cancel() {
    cancel_topic_.publish(json::object());
}

void ActionClient::dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return;
        disposed_ = true;
    }

    goal_topic_.unadvertise();
    cancel_topic_.unadvertise();
    status_listener_.unsubscribe();
    feedback_listener_.unsubscribe();
    result_listener_.unsubscribe();
}

size_t ActionClient::goal_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : goals_) {
        if (!entry.second.expired()) ++count;
    }
    return count;
}

std::shared_ptr<Goal> ActionClient::find_goal(const json& status) {
    const std::string id = status_goal_id(status);
    if (id.empty()) return nullptr;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = goals_.find(id);
    if (it == goals_.end()) return nullptr;

    auto goal = it->second.lock();
    if (!goal) goals_.erase(it);
    return goal;
}

void ActionClient::on_status_message(const json& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        received_status_ = true;
    }

    auto list = message.find("status_list");
    if (list == message.end() || !list->is_array()) return;

    for (const auto& status : *list) {
        if (auto goal = find_goal(status)) {
            goal->handle_status(status);
        }
    }
}

void ActionClient::on_feedback_message(const json& message) {
    const json status = message.value("status", json());
    if (auto goal = find_goal(status)) {
        goal->handle_status(status);
        goal->handle_feedback(message.value("feedback", json()));
    }
}

void ActionClient::on_result_message(const json& message) {
    const json status = message.value("status", json());
    if (auto goal = find_goal(status)) {
        goal->handle_status(status);
        goal->handle_result(message.value("result", json()));
    }
}

// ============================================================================
// SIMPLE ACTION SERVER
// ============================================================================

SimpleActionServer::SimpleActionServer(Ros& ros, const std::string& server_name, const std::string& action_name)
    : ros_(ros),
      server_name_(server_name),
      action_name_(action_name),
      feedback_publisher_(ros, server_name + "/feedback", action_name + "Feedback"),
      result_publisher_(ros, server_name + "/result", action_name + "Result"),
      status_publisher_(ros, server_name + "/status", GOAL_STATUS_ARRAY),
      goal_listener_(ros, server_name + "/goal", action_name + "Goal"),
      cancel_listener_(ros, server_name + "/cancel", GOAL_ID) {

    feedback_publisher_.advertise();
    result_publisher_.advertise();
    status_publisher_.advertise();

    goal_listener_.subscribe(guard_.wrap([this](const json& message) { on_goal_message(message); }));
    cancel_listener_.subscribe(guard_.wrap([this](const json& message) { on_cancel_message(message); }));

    schedule_status();
}

SimpleActionServer::~SimpleActionServer() {
    guard_.expire();
    if (execute_listener_) {
        emitter_.off(action_events::GOAL, execute_listener_);
    }
}

void SimpleActionServer::start(ExecuteCallback execute) {
    if (!execute) {
        throw std::invalid_argument("SimpleActionServer execute callback is not callable");
    }

    std::optional<json> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (execute_listener_) {
            emitter_.off(action_events::GOAL, execute_listener_);
        }
        execute_listener_ = emitter_.on(action_events::GOAL, [this, execute](const json& goal) {
            if (!ros_.call_in_thread([execute, goal] { execute(goal); })) {
                ROSLINK_LOG_WARN("SimpleActionServer") << "Scheduler stopped; goal on " << server_name_ << " not executed";
            }
        });
        if (current_goal_) {
            pending = current_goal_->value("goal", json::object());
        }
    }

    // A goal accepted before start() still needs its executor
    if (pending) {
        emitter_.emit(action_events::GOAL, *pending);
    }
}

bool SimpleActionServer::is_preempt_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preempt_request_;
}

json SimpleActionServer::current_goal_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_goal_) return json();
    return current_goal_->value("goal_id", json());
}

bool SimpleActionServer::has_next_goal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_goal_.has_value();
}

void SimpleActionServer::on_goal_message(const json& message) {
    bool preempt = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_goal_) {
            // Replaces any goal already waiting
            next_goal_ = message;
            preempt_request_ = true;
            preempt = true;
        } else {
            current_goal_ = message;
            preempt_request_ = false;
            status_list_ = json::array({{{"goal_id", message.value("goal_id", json())},
                                         {"status", static_cast<int>(GoalStatus::ACTIVE)},
                                         {"text", ""}}});
        }
    }

    if (preempt) {
        ROSLINK_LOG_DEBUG("SimpleActionServer") << "New goal on " << server_name_ << ", preempting current goal";
        emitter_.emit(action_events::CANCEL);
    } else {
        emitter_.emit(action_events::GOAL, message.value("goal", json::object()));
    }
}

void SimpleActionServer::on_cancel_message(const json& message) {
    const std::string id = message.is_object() ? message.value("id", std::string()) : std::string();
    const Stamp stamp = read_stamp(message.is_object() ? message.value("stamp", json::object()) : json());

    bool preempt = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (id.empty() && stamp.is_zero()) {
            next_goal_.reset();
            preempt = current_goal_.has_value();
        } else {
            if (!id.empty()) {
                if (current_goal_ && status_goal_id(*current_goal_) == id) preempt = true;
                if (next_goal_ && status_goal_id(*next_goal_) == id) next_goal_.reset();
            }
            // A stamp also covers every goal stamped at or before it
            if (!stamp.is_zero()) {
                if (next_goal_ && goal_stamp(*next_goal_) <= stamp) next_goal_.reset();
                if (current_goal_ && goal_stamp(*current_goal_) <= stamp) preempt = true;
            }
        }

        if (preempt) preempt_request_ = true;
    }

    if (preempt) {
        emitter_.emit(action_events::CANCEL);
    }
}

void SimpleActionServer::send_feedback(const json& feedback) {
    json message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_goal_) {
            ROSLINK_LOG_WARN("SimpleActionServer") << "Feedback on " << server_name_ << " without a current goal";
            return;
        }
        message = {
            {"status", {{"goal_id", current_goal_->value("goal_id", json())},
                        {"status", static_cast<int>(GoalStatus::ACTIVE)}}},
            {"feedback", feedback},
        };
    }
    feedback_publisher_.publish(message);
}

void SimpleActionServer::set_succeeded(const json& result) {
    finish_current(GoalStatus::SUCCEEDED, result);
}

void SimpleActionServer::set_aborted(const json& result) {
    finish_current(GoalStatus::ABORTED, result);
}

void SimpleActionServer::set_preempted() {
    finish_current(GoalStatus::PREEMPTED, json::object());
}

void SimpleActionServer::finish_current(GoalStatus status, const json& result) {
    json message;
    std::optional<json> promoted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_goal_) {
            ROSLINK_LOG_WARN("SimpleActionServer") << "No current goal on " << server_name_ << " to finish";
            return;
        }

        message = {
            {"status", {{"goal_id", current_goal_->value("goal_id", json())},
                        {"status", static_cast<int>(status)}}},
            {"result", result},
        };

        status_list_ = json::array();
        preempt_request_ = false;
        current_goal_.reset();

        if (next_goal_) {
            current_goal_ = std::move(next_goal_);
            next_goal_.reset();
            status_list_ = json::array({{{"goal_id", current_goal_->value("goal_id", json())},
                                         {"status", static_cast<int>(GoalStatus::ACTIVE)},
                                         {"text", ""}}});
            promoted = current_goal_->value("goal", json::object());
        }
    }

    ROSLINK_LOG_DEBUG("SimpleActionServer") << "Goal on " << server_name_ << " finished as "
                                            << goal_status_name(static_cast<int>(status));
    result_publisher_.publish(message);

    if (promoted) {
        emitter_.emit(action_events::GOAL, *promoted);
    }
}

void SimpleActionServer::publish_status() {
    // Status is periodic; nothing is queued for a later connection
    if (!ros_.is_connected()) return;

    json message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message = {
            {"header", {{"stamp", now_stamp()}, {"frame_id", ""}}},
            {"status_list", status_list_},
        };
    }
    status_publisher_.publish(message);
}

void SimpleActionServer::schedule_status() {
    ros_.call_later(ros_.config().status_period, guard_.wrap([this] {
        publish_status();
        schedule_status();
    }));
}

} // namespace roslink
