#ifndef ROSLINK_ERRORS_HPP
#define ROSLINK_ERRORS_HPP

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace roslink {

// Base of every error raised by the library
class RosBridgeError : public std::runtime_error {
public:
    explicit RosBridgeError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed envelope, binary frame, or an op we cannot route
class ProtocolError : public RosBridgeError {
public:
    explicit ProtocolError(const std::string& what) : RosBridgeError(what) {}
};

class UnhandledOperationError : public ProtocolError {
public:
    explicit UnhandledOperationError(const std::string& op)
        : ProtocolError("No handler registered for operation \"" + op + "\""), op_(op) {}

    const std::string& op() const { return op_; }

private:
    std::string op_;
};

// Reply whose id matches no outstanding request
class UnmatchedReplyError : public RosBridgeError {
public:
    explicit UnmatchedReplyError(const std::string& id)
        : RosBridgeError("No handler registered for request ID: \"" + id + "\""), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class TimeoutError : public RosBridgeError {
public:
    explicit TimeoutError(const std::string& what) : RosBridgeError(what) {}
};

class ServiceTimeoutError : public TimeoutError {
public:
    explicit ServiceTimeoutError(const std::string& service)
        : TimeoutError("No service response received for " + service) {}
};

class GoalTimeoutError : public TimeoutError {
public:
    explicit GoalTimeoutError(const std::string& goal_id)
        : TimeoutError("Goal " + goal_id + " failed to receive result") {}
};

class ConnectionTimeoutError : public TimeoutError {
public:
    explicit ConnectionTimeoutError(const std::string& url)
        : TimeoutError("Failed to connect to ROS at " + url) {}
};

// Remote side answered with result == false. values() holds what it sent back.
class ServiceError : public RosBridgeError {
public:
    explicit ServiceError(nlohmann::json values)
        : RosBridgeError("Service call failed: " + values.dump()), values_(std::move(values)) {}

    const nlohmann::json& values() const { return values_; }

private:
    nlohmann::json values_;
};

// Bridge-native action finished with result == false. values() holds
// {"status": <name>, "values": <values>}.
class ActionError : public RosBridgeError {
public:
    explicit ActionError(nlohmann::json values)
        : RosBridgeError("Action goal failed: " + values.dump()), values_(std::move(values)) {}

    const nlohmann::json& values() const { return values_; }

private:
    nlohmann::json values_;
};

class ConfigError : public RosBridgeError {
public:
    explicit ConfigError(const std::string& what) : RosBridgeError(what) {}
};

} // namespace roslink

#endif // ROSLINK_ERRORS_HPP
