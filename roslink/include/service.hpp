#ifndef ROSLINK_SERVICE_HPP
#define ROSLINK_SERVICE_HPP

#include "lifetime_guard.hpp"
#include "ros.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace roslink {

using json = nlohmann::json;

// Client and/or server of one ROS service
class Service {
public:
    using ResponseCallback = std::function<void(const json&)>;
    using ErrorCallback = std::function<void(const json&)>;

    // Fills response from request; returns false to report failure to the caller
    using Handler = std::function<bool(const json& request, json& response)>;

    Service(Ros& ros, const std::string& name, const std::string& service_type);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Non-blocking call. Does nothing while this instance advertises the service.
    void call(const json& request, ResponseCallback callback, ErrorCallback errback = nullptr);

    // Blocking call returning the response values. Throws ServiceError or
    // ServiceTimeoutError; returns null while this instance advertises the service.
    json call(const json& request);
    json call(const json& request, std::chrono::milliseconds timeout);

    // Turns this instance into the server. The handler runs on the transport
    // thread and must not issue blocking calls.
    void advertise(Handler handler);
    void unadvertise();

    bool is_advertised() const;

    const std::string& name() const { return name_; }
    const std::string& service_type() const { return service_type_; }

private:
    json make_request(const json& request);
    void handle_request(const json& envelope);

    Ros& ros_;
    std::string name_;
    std::string service_type_;

    mutable std::mutex mutex_;
    bool advertised_ = false;
    Handler handler_;
    Ros::Listener request_listener_;

    // Request handling runs only while the service object is alive
    LifetimeGuard guard_;
};

} // namespace roslink

#endif // ROSLINK_SERVICE_HPP
