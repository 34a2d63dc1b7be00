#include "protocol.hpp"
#include "errors.hpp"

namespace roslink {

namespace {

const json& required(const json& envelope, const char* field, const std::string& op) {
    auto it = envelope.find(field);
    if (it == envelope.end()) {
        throw ProtocolError("Expected field \"" + std::string(field) + "\" missing in " + op + " message");
    }
    return *it;
}

std::string required_string(const json& envelope, const char* field, const std::string& op) {
    const json& value = required(envelope, field, op);
    if (!value.is_string()) {
        throw ProtocolError("Field \"" + std::string(field) + "\" of " + op + " message is not a string");
    }
    return value.get<std::string>();
}

std::string optional_string(const json& envelope, const char* field) {
    auto it = envelope.find(field);
    if (it == envelope.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

json optional_value(const json& envelope, const char* field) {
    auto it = envelope.find(field);
    return it == envelope.end() ? json() : *it;
}

// Only an explicit false marks a failed call
bool result_flag(const json& envelope) {
    auto it = envelope.find("result");
    return !(it != envelope.end() && it->is_boolean() && !it->get<bool>());
}

} // namespace

const char* goal_status_name(int status) {
    switch (static_cast<GoalStatus>(status)) {
        case GoalStatus::PENDING:    return "PENDING";
        case GoalStatus::ACTIVE:     return "ACTIVE";
        case GoalStatus::PREEMPTED:  return "PREEMPTED";
        case GoalStatus::SUCCEEDED:  return "SUCCEEDED";
        case GoalStatus::ABORTED:    return "ABORTED";
        case GoalStatus::REJECTED:   return "REJECTED";
        case GoalStatus::PREEMPTING: return "PREEMPTING";
        case GoalStatus::RECALLING:  return "RECALLING";
        case GoalStatus::RECALLED:   return "RECALLED";
        case GoalStatus::LOST:       return "LOST";
    }
    return "UNKNOWN";
}

bool is_active_status(int status) {
    switch (static_cast<GoalStatus>(status)) {
        case GoalStatus::PENDING:
        case GoalStatus::ACTIVE:
        case GoalStatus::PREEMPTING:
        case GoalStatus::RECALLING:
            return true;
        default:
            return false;
    }
}

json decode(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError("Envelope is not a JSON object");
    }
    auto op = j.find("op");
    if (op == j.end() || !op->is_string()) {
        throw ProtocolError("Envelope without \"op\" field");
    }
    return j;
}

InboundMessage parse_inbound(const json& j) {
    const std::string op = j.at("op").get<std::string>();

    if (op == ops::PUBLISH) {
        return PublishMessage{required_string(j, "topic", op), optional_value(j, "msg")};
    }
    if (op == ops::SERVICE_RESPONSE) {
        return ServiceResponseMessage{required_string(j, "id", op), optional_string(j, "service"),
                                      optional_value(j, "values"), result_flag(j)};
    }
    if (op == ops::CALL_SERVICE) {
        return ServiceRequestMessage{required_string(j, "service", op), j};
    }
    if (op == ops::ACTION_FEEDBACK) {
        return ActionFeedbackMessage{required_string(j, "id", op), required_string(j, "action", op),
                                     optional_value(j, "values")};
    }
    if (op == ops::ACTION_RESULT) {
        const json& status = required(j, "status", op);
        if (!status.is_number_integer()) {
            throw ProtocolError("Field \"status\" of action_result message is not an integer");
        }
        return ActionResultMessage{required_string(j, "id", op), optional_string(j, "action"),
                                   optional_value(j, "values"), status.get<int>(), result_flag(j)};
    }
    if (op == ops::STATUS) {
        return StatusMessage{optional_string(j, "id"), optional_string(j, "level"), optional_string(j, "msg")};
    }
    return UnhandledMessage{op, j};
}

std::string encode(const json& envelope) {
    return envelope.dump();
}

std::string make_request_id(const std::string& op, const std::string& name, uint64_t counter) {
    return op + ":" + name + ":" + std::to_string(counter);
}

namespace envelope {

json subscribe(const std::string& id, const std::string& topic, const std::string& type,
               const std::string& compression, int throttle_rate, int queue_length) {
    return {
        {"op", ops::SUBSCRIBE},
        {"id", id},
        {"type", type},
        {"topic", topic},
        {"compression", compression},
        {"throttle_rate", throttle_rate},
        {"queue_length", queue_length}
    };
}

json unsubscribe(const std::string& id, const std::string& topic) {
    return {{"op", ops::UNSUBSCRIBE}, {"id", id}, {"topic", topic}};
}

json publish(const std::string& id, const std::string& topic, const json& msg, bool latch) {
    return {{"op", ops::PUBLISH}, {"id", id}, {"topic", topic}, {"msg", msg}, {"latch", latch}};
}

json advertise(const std::string& id, const std::string& topic, const std::string& type,
               bool latch, int queue_size) {
    return {
        {"op", ops::ADVERTISE},
        {"id", id},
        {"type", type},
        {"topic", topic},
        {"latch", latch},
        {"queue_size", queue_size}
    };
}

json unadvertise(const std::string& id, const std::string& topic) {
    return {{"op", ops::UNADVERTISE}, {"id", id}, {"topic", topic}};
}

json call_service(const std::string& id, const std::string& service, const json& args) {
    return {{"op", ops::CALL_SERVICE}, {"id", id}, {"service", service}, {"args", args}};
}

json service_response(const std::string& id, const std::string& service,
                      const json& values, bool result) {
    json msg = {{"op", ops::SERVICE_RESPONSE}, {"service", service}, {"values", values}, {"result", result}};
    if (!id.empty()) {
        msg["id"] = id;
    }
    return msg;
}

json advertise_service(const std::string& service, const std::string& type) {
    return {{"op", ops::ADVERTISE_SERVICE}, {"type", type}, {"service", service}};
}

json unadvertise_service(const std::string& service, const std::string& type) {
    return {{"op", ops::UNADVERTISE_SERVICE}, {"type", type}, {"service", service}};
}

json send_action_goal(const std::string& id, const std::string& action,
                      const std::string& action_type, const json& args, bool feedback) {
    return {
        {"op", ops::SEND_ACTION_GOAL},
        {"id", id},
        {"action", action},
        {"action_type", action_type},
        {"args", args},
        {"feedback", feedback}
    };
}

json cancel_action_goal(const std::string& id, const std::string& action, const json& args) {
    return {{"op", ops::CANCEL_ACTION_GOAL}, {"id", id}, {"action", action}, {"args", args}};
}

json set_level(const std::string& level, const std::string& id) {
    return {{"op", ops::SET_LEVEL}, {"level", level}, {"id", id}};
}

} // namespace envelope

} // namespace roslink
