#include "config.hpp"
#include "errors.hpp"

#include <fstream>

namespace roslink {

namespace {

std::chrono::milliseconds millis(const nlohmann::json& section, const char* key,
                                 std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(section.value(key, static_cast<int64_t>(fallback.count())));
}

} // namespace

std::string RosConfig::url() const {
    return "ws://" + host + ":" + std::to_string(port) + (path.empty() ? "/" : path);
}

RosConfig RosConfig::from_url(const std::string& url) {
    RosConfig config;

    const std::string scheme = "ws://";
    if (url.compare(0, 6, "wss://") == 0) {
        throw ConfigError("Secure WebSocket URLs are not supported: " + url);
    }
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw ConfigError("Expected a ws:// URL, got: " + url);
    }

    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    config.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        config.host = authority;
    } else {
        config.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        try {
            size_t used = 0;
            int value = std::stoi(port, &used);
            if (used != port.size() || value <= 0 || value > 65535) {
                throw ConfigError("Invalid port in URL: " + url);
            }
            config.port = static_cast<uint16_t>(value);
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid port in URL: " + url);
        }
    }

    if (config.host.empty()) {
        throw ConfigError("Missing host in URL: " + url);
    }
    return config;
}

RosConfig RosConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    try {
        RosConfig config;

        if (j.contains("connection")) {
            auto& conn = j["connection"];
            if (conn.contains("url")) {
                config = from_url(conn["url"].get<std::string>());
            }
            config.host = conn.value("host", config.host);
            config.port = conn.value("port", config.port);
            config.path = conn.value("path", config.path);
            if (conn.contains("headers")) {
                config.headers = conn["headers"].get<std::map<std::string, std::string>>();
            }
        }

        if (j.contains("timeouts")) {
            auto& t = j["timeouts"];
            config.connect_timeout = millis(t, "connect_ms", config.connect_timeout);
            config.close_timeout = millis(t, "close_ms", config.close_timeout);
            config.service_timeout = millis(t, "service_ms", config.service_timeout);
        }

        if (j.contains("reconnect")) {
            auto& r = j["reconnect"];
            config.reconnect = r.value("enabled", config.reconnect);
            config.reconnect_delay = millis(r, "delay_ms", config.reconnect_delay);
            config.max_reconnect_delay = millis(r, "max_delay_ms", config.max_reconnect_delay);
        }

        if (j.contains("scheduler")) {
            config.worker_threads = j["scheduler"].value("worker_threads", config.worker_threads);
        }

        if (j.contains("actionlib")) {
            config.status_period = millis(j["actionlib"], "status_period_ms", config.status_period);
        }

        if (j.contains("logging")) {
            const std::string level = j["logging"].value("level", std::string("info"));
            if (!log::parse_level(level, config.log_level)) {
                throw ConfigError("Unknown log level: " + level);
            }
        }

        return config;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

RosConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Error parsing config file " + path + ": " + e.what());
    }
    return RosConfig::from_json(j);
}

} // namespace roslink
