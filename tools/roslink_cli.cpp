// Command-line front end for a rosbridge server
// Usage: roslink_cli [--url ws://host:port] [--config file.json] <group> <command> [args]

#include "errors.hpp"
#include "log.hpp"
#include "param.hpp"
#include "ros.hpp"
#include "service.hpp"
#include "topic.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace roslink;

std::atomic<bool> g_shutdown(false);

void signal_handler(int signal) {
    (void)signal;
    g_shutdown = true;
}

namespace {

void print_usage() {
    std::cout << "Usage: roslink_cli [--url URL] [--config FILE] [--log LEVEL] <group> <command> [args]\n"
              << "\n"
              << "  topic list\n"
              << "  topic type <topic>\n"
              << "  topic find <message_type>\n"
              << "  topic echo <topic> [message_type]\n"
              << "  topic pub <topic> <message_type> <json>\n"
              << "  service list\n"
              << "  service type <service>\n"
              << "  service call <service> [json]\n"
              << "  param get <name>\n"
              << "  param set <name> <json>\n"
              << "  param delete <name>\n"
              << "  msg info <message_type>\n";
}

void print_list(const std::vector<std::string>& items) {
    for (const auto& item : items) {
        std::cout << item << "\n";
    }
}

json parse_argument(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Invalid JSON argument '" + text + "': " + e.what());
    }
}

int topic_command(Ros& ros, const std::vector<std::string>& args) {
    const std::string& command = args[1];

    if (command == "list") {
        print_list(ros.get_topics());
        return 0;
    }
    if (command == "type" && args.size() >= 3) {
        std::cout << ros.get_topic_type(args[2]) << "\n";
        return 0;
    }
    if (command == "find" && args.size() >= 3) {
        print_list(ros.get_topics_for_type(args[2]));
        return 0;
    }
    if (command == "echo" && args.size() >= 3) {
        std::string type = args.size() >= 4 ? args[3] : ros.get_topic_type(args[2]);
        if (type.empty()) {
            std::cerr << "[CLI] Cannot determine type of " << args[2] << std::endl;
            return 1;
        }

        Topic topic(ros, args[2], type);
        topic.subscribe([](const json& message) {
            std::lock_guard<std::mutex> lock(log::output_mutex());
            std::cout << message.dump() << std::endl;
        });

        while (!g_shutdown && ros.is_connected()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return 0;
    }
    if (command == "pub" && args.size() >= 5) {
        Topic topic(ros, args[2], args[3]);
        topic.publish(parse_argument(args[4]));
        // Give the bridge a moment to forward before unadvertising
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        return 0;
    }

    print_usage();
    return 1;
}

int service_command(Ros& ros, const std::vector<std::string>& args) {
    const std::string& command = args[1];

    if (command == "list") {
        print_list(ros.get_services());
        return 0;
    }
    if (command == "type" && args.size() >= 3) {
        std::cout << ros.get_service_type(args[2]) << "\n";
        return 0;
    }
    if (command == "call" && args.size() >= 3) {
        Service service(ros, args[2], ros.get_service_type(args[2]));
        json request = args.size() >= 4 ? parse_argument(args[3]) : json::object();
        std::cout << service.call(request).dump(2) << "\n";
        return 0;
    }

    print_usage();
    return 1;
}

int param_command(Ros& ros, const std::vector<std::string>& args) {
    const std::string& command = args[1];

    if (command == "get" && args.size() >= 3) {
        std::cout << Param(ros, args[2]).get().dump() << "\n";
        return 0;
    }
    if (command == "set" && args.size() >= 4) {
        Param(ros, args[2]).set(parse_argument(args[3]));
        return 0;
    }
    if (command == "delete" && args.size() >= 3) {
        Param(ros, args[2]).remove();
        return 0;
    }

    print_usage();
    return 1;
}

int msg_command(Ros& ros, const std::vector<std::string>& args) {
    if (args[1] == "info" && args.size() >= 3) {
        std::cout << ros.get_message_details(args[2]).dump(2) << "\n";
        return 0;
    }

    print_usage();
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    RosConfig config;
    std::string log_level;
    std::vector<std::string> args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--url" && i + 1 < argc) {
                const auto headers = config.headers;
                config = RosConfig::from_url(argv[++i]);
                config.headers = headers;
            } else if (arg == "--config" && i + 1 < argc) {
                config = load_config(argv[++i]);
            } else if (arg == "--log" && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else {
                args.push_back(arg);
            }
        }
    } catch (const RosBridgeError& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
        return 1;
    }

    if (!log_level.empty() && !log::parse_level(log_level, config.log_level)) {
        std::cerr << "[CLI] Unknown log level: " << log_level << std::endl;
        return 1;
    }

    if (args.size() < 2) {
        print_usage();
        return 1;
    }

    // The CLI does not retry; failures are reported once
    config.reconnect = false;

    Ros ros(config);
    int rc = 1;

    try {
        ros.run();

        const std::string& group = args[0];
        if (group == "topic") rc = topic_command(ros, args);
        else if (group == "service") rc = service_command(ros, args);
        else if (group == "param") rc = param_command(ros, args);
        else if (group == "msg") rc = msg_command(ros, args);
        else print_usage();
    } catch (const RosBridgeError& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CLI] " << e.what() << std::endl;
    }

    ros.terminate();
    return rc;
}
