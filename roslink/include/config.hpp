#ifndef ROSLINK_CONFIG_HPP
#define ROSLINK_CONFIG_HPP

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace roslink {

struct RosConfig {
    std::string host = "localhost";
    uint16_t port = 9090;
    std::string path = "/";

    // Extra HTTP headers sent with the WebSocket handshake
    std::map<std::string, std::string> headers;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds close_timeout{5000};
    std::chrono::milliseconds service_timeout{5000};

    // Reconnect after connections we did not close ourselves
    bool reconnect = true;
    std::chrono::milliseconds reconnect_delay{1000};
    std::chrono::milliseconds max_reconnect_delay{30000};

    size_t worker_threads = 4;

    // Period of the status array a SimpleActionServer publishes
    std::chrono::milliseconds status_period{500};

    log::Level log_level = log::Level::info;

    std::string url() const;

    // Accepts "ws://host[:port][/path]". Throws ConfigError.
    static RosConfig from_url(const std::string& url);

    // Unknown keys are ignored; missing keys keep their defaults. Throws ConfigError.
    static RosConfig from_json(const nlohmann::json& j);
};

// Reads a JSON config file. Throws ConfigError.
RosConfig load_config(const std::string& path);

} // namespace roslink

#endif // ROSLINK_CONFIG_HPP
