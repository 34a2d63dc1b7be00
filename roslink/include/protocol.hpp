#ifndef ROSLINK_PROTOCOL_HPP
#define ROSLINK_PROTOCOL_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace roslink {

using json = nlohmann::json;

// ============================================================================
// OPERATION TAGS
// ============================================================================

namespace ops {
    constexpr const char* PUBLISH = "publish";
    constexpr const char* SUBSCRIBE = "subscribe";
    constexpr const char* UNSUBSCRIBE = "unsubscribe";
    constexpr const char* ADVERTISE = "advertise";
    constexpr const char* UNADVERTISE = "unadvertise";
    constexpr const char* CALL_SERVICE = "call_service";
    constexpr const char* SERVICE_RESPONSE = "service_response";
    constexpr const char* ADVERTISE_SERVICE = "advertise_service";
    constexpr const char* UNADVERTISE_SERVICE = "unadvertise_service";
    constexpr const char* SEND_ACTION_GOAL = "send_action_goal";
    constexpr const char* CANCEL_ACTION_GOAL = "cancel_action_goal";
    constexpr const char* ACTION_FEEDBACK = "action_feedback";
    constexpr const char* ACTION_RESULT = "action_result";
    constexpr const char* STATUS = "status";
    constexpr const char* SET_LEVEL = "set_level";
}

// actionlib_msgs/GoalStatus values
enum class GoalStatus : int {
    PENDING = 0,
    ACTIVE = 1,
    PREEMPTED = 2,
    SUCCEEDED = 3,
    ABORTED = 4,
    REJECTED = 5,
    PREEMPTING = 6,
    RECALLING = 7,
    RECALLED = 8,
    LOST = 9
};

// "SUCCEEDED", "ABORTED", ... or "UNKNOWN" for values outside the enumeration
const char* goal_status_name(int status);

// PENDING, ACTIVE, PREEMPTING and RECALLING are the states a goal can still leave
bool is_active_status(int status);

// ============================================================================
// INBOUND ENVELOPES
// ============================================================================

struct PublishMessage {
    std::string topic;
    json msg;
};

struct ServiceResponseMessage {
    std::string id;
    std::string service;
    json values;
    bool result = true;
};

// Request addressed to a service this client advertises
struct ServiceRequestMessage {
    std::string service;
    json envelope;
};

struct ActionFeedbackMessage {
    std::string id;
    std::string action;
    json values;
};

struct ActionResultMessage {
    std::string id;
    std::string action;
    json values;
    int status = 0;
    bool result = true;
};

struct StatusMessage {
    std::string id;
    std::string level;
    std::string msg;
};

// Anything a client has no business receiving (subscribe, send_action_goal, ...)
struct UnhandledMessage {
    std::string op;
    json envelope;
};

using InboundMessage = std::variant<
    PublishMessage,
    ServiceResponseMessage,
    ServiceRequestMessage,
    ActionFeedbackMessage,
    ActionResultMessage,
    StatusMessage,
    UnhandledMessage>;

// Parses one text frame into an envelope object. Throws ProtocolError.
json decode(const std::string& payload);

// Classifies an envelope by its op tag. Throws ProtocolError when a field the
// op depends on is missing or has the wrong type.
InboundMessage parse_inbound(const json& envelope);

std::string encode(const json& envelope);

// "{op}:{name}:{counter}"
std::string make_request_id(const std::string& op, const std::string& name, uint64_t counter);

// ============================================================================
// OUTBOUND ENVELOPES
// ============================================================================

namespace envelope {

json subscribe(const std::string& id, const std::string& topic, const std::string& type,
               const std::string& compression, int throttle_rate, int queue_length);
json unsubscribe(const std::string& id, const std::string& topic);
json publish(const std::string& id, const std::string& topic, const json& msg, bool latch);
json advertise(const std::string& id, const std::string& topic, const std::string& type,
               bool latch, int queue_size);
json unadvertise(const std::string& id, const std::string& topic);

json call_service(const std::string& id, const std::string& service, const json& args);
// id may be empty when the request carried none
json service_response(const std::string& id, const std::string& service,
                      const json& values, bool result);
json advertise_service(const std::string& service, const std::string& type);
json unadvertise_service(const std::string& service, const std::string& type);

json send_action_goal(const std::string& id, const std::string& action,
                      const std::string& action_type, const json& args, bool feedback);
json cancel_action_goal(const std::string& id, const std::string& action, const json& args);

json set_level(const std::string& level, const std::string& id);

} // namespace envelope

} // namespace roslink

#endif // ROSLINK_PROTOCOL_HPP
