#include "action.hpp"
#include "log.hpp"

namespace roslink {

Action::Action(Ros& ros, const std::string& name, const std::string& action_type)
    : ros_(ros), name_(name), action_type_(action_type) {
}

json Action::make_goal(const json& goal, bool feedback) {
    return envelope::send_action_goal(ros_.make_id(ops::SEND_ACTION_GOAL, name_), name_, action_type_,
                                      goal.is_null() ? json::object() : goal, feedback);
}

std::string Action::send_goal(const json& goal, ValueCallback on_result,
                              ValueCallback on_feedback, ValueCallback on_error) {
    json message = make_goal(goal, static_cast<bool>(on_feedback));
    std::string id = message["id"].get<std::string>();

    ros_.send_action_goal(std::move(message), std::move(on_result), std::move(on_feedback), std::move(on_error));
    ROSLINK_LOG_DEBUG("Action") << "Sent goal " << id << " to " << name_;
    return id;
}

json Action::send_goal(const json& goal, std::chrono::milliseconds timeout, ValueCallback on_feedback) {
    json message = make_goal(goal, static_cast<bool>(on_feedback));
    return ros_.call_sync_action(std::move(message), timeout, std::move(on_feedback));
}

void Action::cancel_goal(const std::string& goal_id) {
    ros_.cancel_action_goal(envelope::cancel_action_goal(goal_id, name_, json::object()));
}

} // namespace roslink
