#include "topic.hpp"
#include "log.hpp"

#include <stdexcept>

namespace roslink {

namespace {

// Lets the new connection settle before re-registering
constexpr std::chrono::milliseconds REREGISTER_DELAY{500};

bool supported_compression(const std::string& compression) {
    return compression == "none" || compression == "png" ||
           compression == "cbor" || compression == "cbor-raw";
}

} // namespace

Topic::Topic(Ros& ros, const std::string& name, const std::string& message_type, TopicOptions options)
    : ros_(ros), name_(name), message_type_(message_type), options_(std::move(options)) {

    if (options_.compression.empty()) {
        options_.compression = "none";
    }
    if (!supported_compression(options_.compression)) {
        throw std::invalid_argument("Unsupported compression type \"" + options_.compression +
                                    "\". Must be one of: none, png, cbor, cbor-raw");
    }

    if (options_.reconnect_on_close) {
        close_listener_ = ros_.on(events::CLOSE, guard_.wrap([this](const json& event) {
            on_connection_closed(event);
        }));
    }
}

Topic::~Topic() {
    guard_.expire();
    if (close_listener_) {
        ros_.off(events::CLOSE, close_listener_);
    }
    unsubscribe();
    unadvertise();
}

void Topic::subscribe(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Avoid duplicate subscription
    if (subscribe_id_) return;

    message_listener_ = ros_.on(name_, std::move(callback));
    send_subscribe_locked();
    ROSLINK_LOG_DEBUG("Topic") << "Subscribed to " << name_;
}

void Topic::unsubscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!subscribe_id_) return;

    ros_.off(name_, message_listener_);
    message_listener_.reset();
    ros_.send_on_ready(envelope::unsubscribe(*subscribe_id_, name_));
    subscribe_id_.reset();
    subscribe_sent_.reset();
}

void Topic::publish(const json& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!advertise_id_) {
        send_advertise_locked();
    }

    ros_.send_on_ready(envelope::publish(ros_.make_id(ops::PUBLISH, name_), name_, message, options_.latch));
}

void Topic::advertise() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (advertise_id_) return;

    send_advertise_locked();
    ROSLINK_LOG_DEBUG("Topic") << "Advertised " << name_ << " as " << message_type_;
}

void Topic::unadvertise() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!advertise_id_) return;

    ros_.send_on_ready(envelope::unadvertise(*advertise_id_, name_));
    advertise_id_.reset();
    advertise_sent_.reset();
}

bool Topic::is_subscribed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribe_id_.has_value();
}

bool Topic::is_advertised() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertise_id_.has_value();
}

void Topic::send_subscribe_locked() {
    subscribe_id_ = ros_.make_id(ops::SUBSCRIBE, name_);
    subscribe_sent_ = std::make_shared<std::atomic<bool>>(false);
    ros_.send_on_ready(envelope::subscribe(*subscribe_id_, name_, message_type_, options_.compression,
                                           options_.throttle_rate, options_.queue_length),
                       [sent = subscribe_sent_] { *sent = true; });
}

void Topic::send_advertise_locked() {
    advertise_id_ = ros_.make_id(ops::ADVERTISE, name_);
    advertise_sent_ = std::make_shared<std::atomic<bool>>(false);
    ros_.send_on_ready(envelope::advertise(*advertise_id_, name_, message_type_,
                                           options_.latch, options_.queue_size),
                       [sent = advertise_sent_] { *sent = true; });
}

void Topic::on_connection_closed(const json& event) {
    if (event.value("user_initiated", false)) return;

    // Only registrations the lost connection saw need repeating; a frame still
    // queued goes out, once, on the next ready transition.
    std::string seen_subscribe_id;
    std::string seen_advertise_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscribe_id_ && *subscribe_sent_) seen_subscribe_id = *subscribe_id_;
        if (advertise_id_ && *advertise_sent_) seen_advertise_id = *advertise_id_;
    }
    if (seen_subscribe_id.empty() && seen_advertise_id.empty()) return;

    ros_.call_later(REREGISTER_DELAY, guard_.wrap([this, seen_subscribe_id, seen_advertise_id] {
        reregister(seen_subscribe_id, seen_advertise_id);
    }));
}

void Topic::reregister(const std::string& seen_subscribe_id, const std::string& seen_advertise_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    // The bridge forgot us with the old connection; fresh ids, same listener.
    // An id that changed since the close was already re-registered or released.
    if (subscribe_id_ && *subscribe_id_ == seen_subscribe_id) {
        send_subscribe_locked();
        ROSLINK_LOG_INFO("Topic") << "Re-subscribing to " << name_;
    }
    if (advertise_id_ && *advertise_id_ == seen_advertise_id) {
        send_advertise_locked();
        ROSLINK_LOG_INFO("Topic") << "Re-advertising " << name_;
    }
}

} // namespace roslink
