#include "param.hpp"
#include "errors.hpp"
#include "service.hpp"

namespace roslink {

namespace {

const char* const GET_PARAM = "/rosapi/get_param";
const char* const SET_PARAM = "/rosapi/set_param";
const char* const DELETE_PARAM = "/rosapi/delete_param";

} // namespace

Param::Param(Ros& ros, const std::string& name) : ros_(ros), name_(name) {
}

json Param::decode_value(const json& response) {
    auto it = response.find("value");
    if (it == response.end() || !it->is_string() || it->get<std::string>().empty()) {
        return json();
    }

    try {
        return json::parse(it->get<std::string>());
    } catch (const json::parse_error& e) {
        throw ProtocolError("Parameter value is not valid JSON: " + std::string(e.what()));
    }
}

json Param::get() {
    return get(ros_.config().service_timeout);
}

json Param::get(std::chrono::milliseconds timeout) {
    Service service(ros_, GET_PARAM, "rosapi/GetParam");
    return decode_value(service.call({{"name", name_}}, timeout));
}

void Param::get(ValueCallback callback, ValueCallback errback) {
    Service service(ros_, GET_PARAM, "rosapi/GetParam");
    service.call(
        {{"name", name_}},
        [callback, errback](const json& response) {
            json value;
            try {
                value = decode_value(response);
            } catch (const ProtocolError& e) {
                if (errback) errback({{"error", e.what()}});
                return;
            }
            if (callback) callback(value);
        },
        errback);
}

void Param::set(const json& value) {
    set(value, ros_.config().service_timeout);
}

void Param::set(const json& value, std::chrono::milliseconds timeout) {
    Service service(ros_, SET_PARAM, "rosapi/SetParam");
    service.call({{"name", name_}, {"value", value.dump()}}, timeout);
}

void Param::set(const json& value, ValueCallback callback, ValueCallback errback) {
    Service service(ros_, SET_PARAM, "rosapi/SetParam");
    service.call({{"name", name_}, {"value", value.dump()}}, std::move(callback), std::move(errback));
}

void Param::remove() {
    remove(ros_.config().service_timeout);
}

void Param::remove(std::chrono::milliseconds timeout) {
    Service service(ros_, DELETE_PARAM, "rosapi/DeleteParam");
    service.call({{"name", name_}}, timeout);
}

void Param::remove(ValueCallback callback, ValueCallback errback) {
    Service service(ros_, DELETE_PARAM, "rosapi/DeleteParam");
    service.call({{"name", name_}}, std::move(callback), std::move(errback));
}

} // namespace roslink
