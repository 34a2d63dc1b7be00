#include "service.hpp"
#include "log.hpp"

#include <stdexcept>

namespace roslink {

Service::Service(Ros& ros, const std::string& name, const std::string& service_type)
    : ros_(ros), name_(name), service_type_(service_type) {
}

Service::~Service() {
    guard_.expire();
    unadvertise();
}

json Service::make_request(const json& request) {
    return envelope::call_service(ros_.make_id(ops::CALL_SERVICE, name_), name_,
                                  request.is_null() ? json::object() : request);
}

void Service::call(const json& request, ResponseCallback callback, ErrorCallback errback) {
    if (is_advertised()) return;

    ros_.call_async_service(make_request(request), std::move(callback), std::move(errback));
}

json Service::call(const json& request) {
    return call(request, ros_.config().service_timeout);
}

json Service::call(const json& request, std::chrono::milliseconds timeout) {
    if (is_advertised()) return json();

    return ros_.call_sync_service(make_request(request), timeout);
}

void Service::advertise(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Service handler is not callable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (advertised_) return;

    handler_ = std::move(handler);
    request_listener_ = ros_.on(name_, guard_.wrap([this](const json& envelope) { handle_request(envelope); }));
    ros_.send_on_ready(envelope::advertise_service(name_, service_type_));
    advertised_ = true;
    ROSLINK_LOG_DEBUG("Service") << "Advertised " << name_ << " as " << service_type_;
}

void Service::unadvertise() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!advertised_) return;

    ros_.send_on_ready(envelope::unadvertise_service(name_, service_type_));
    ros_.off(name_, request_listener_);
    request_listener_.reset();
    advertised_ = false;
}

bool Service::is_advertised() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertised_;
}

void Service::handle_request(const json& envelope) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!advertised_) return;
        handler = handler_;
    }

    json response = json::object();
    bool success = false;
    try {
        success = handler(envelope.value("args", json::object()), response);
    } catch (const std::exception& e) {
        ROSLINK_LOG_ERROR("Service") << "Handler for " << name_ << " failed: " << e.what();
        response = {{"error", e.what()}};
        success = false;
    }

    std::string id;
    auto it = envelope.find("id");
    if (it != envelope.end() && it->is_string()) {
        id = it->get<std::string>();
    }
    ros_.send_on_ready(envelope::service_response(id, name_, response, success));
}

} // namespace roslink
