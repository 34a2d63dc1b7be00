#ifndef ROSLINK_ACTION_HPP
#define ROSLINK_ACTION_HPP

#include "ros.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace roslink {

using json = nlohmann::json;

// Client of a bridge-native action (send_action_goal / action_result ops).
// Result and error callbacks receive {"status": <name>, "values": <values>}.
class Action {
public:
    using ValueCallback = std::function<void(const json&)>;

    Action(Ros& ros, const std::string& name, const std::string& action_type);

    // Returns the goal id, usable with cancel_goal
    std::string send_goal(const json& goal, ValueCallback on_result,
                          ValueCallback on_feedback = nullptr, ValueCallback on_error = nullptr);

    // Blocks for the result. Throws ActionError or GoalTimeoutError.
    json send_goal(const json& goal, std::chrono::milliseconds timeout,
                   ValueCallback on_feedback = nullptr);

    void cancel_goal(const std::string& goal_id);

    const std::string& name() const { return name_; }
    const std::string& action_type() const { return action_type_; }

private:
    json make_goal(const json& goal, bool feedback);

    Ros& ros_;
    std::string name_;
    std::string action_type_;
};

} // namespace roslink

#endif // ROSLINK_ACTION_HPP
