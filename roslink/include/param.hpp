#ifndef ROSLINK_PARAM_HPP
#define ROSLINK_PARAM_HPP

#include "ros.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace roslink {

using json = nlohmann::json;

// One parameter on the ROS parameter server, accessed through rosapi.
// Values travel JSON-encoded inside a string field.
class Param {
public:
    using ValueCallback = std::function<void(const json&)>;

    Param(Ros& ros, const std::string& name);

    // Null when the parameter is unset
    json get();
    json get(std::chrono::milliseconds timeout);
    void get(ValueCallback callback, ValueCallback errback = nullptr);

    void set(const json& value);
    void set(const json& value, std::chrono::milliseconds timeout);
    void set(const json& value, ValueCallback callback, ValueCallback errback = nullptr);

    void remove();
    void remove(std::chrono::milliseconds timeout);
    void remove(ValueCallback callback, ValueCallback errback = nullptr);

    const std::string& name() const { return name_; }

private:
    static json decode_value(const json& response);

    Ros& ros_;
    std::string name_;
};

} // namespace roslink

#endif // ROSLINK_PARAM_HPP
