#ifndef ROSLINK_TOPIC_HPP
#define ROSLINK_TOPIC_HPP

#include "lifetime_guard.hpp"
#include "ros.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace roslink {

using json = nlohmann::json;

struct TopicOptions {
    // "none", "png", "cbor" or "cbor-raw"
    std::string compression = "none";
    bool latch = false;
    // Minimum milliseconds between messages the bridge sends us
    int throttle_rate = 0;
    // Bridge-side queue when re-publishing our messages
    int queue_size = 100;
    // Bridge-side queue when subscribing
    int queue_length = 0;
    // Re-register subscription/advertisement after an unexpected disconnect
    bool reconnect_on_close = true;
};

// Publish and/or subscribe to one ROS topic. subscribe/advertise while already
// active, and unsubscribe/unadvertise while inactive, are no-ops.
class Topic {
public:
    using MessageCallback = std::function<void(const json&)>;

    Topic(Ros& ros, const std::string& name, const std::string& message_type,
          TopicOptions options = TopicOptions());
    ~Topic();

    Topic(const Topic&) = delete;
    Topic& operator=(const Topic&) = delete;

    void subscribe(MessageCallback callback);
    void unsubscribe();

    // Advertises first if needed
    void publish(const json& message);

    void advertise();
    void unadvertise();

    bool is_subscribed() const;
    bool is_advertised() const;

    const std::string& name() const { return name_; }
    const std::string& message_type() const { return message_type_; }
    const TopicOptions& options() const { return options_; }

private:
    // Set once the frame carrying the current id is bound to a connection
    using SentFlag = std::shared_ptr<std::atomic<bool>>;

    void on_connection_closed(const json& event);
    void reregister(const std::string& seen_subscribe_id, const std::string& seen_advertise_id);
    void send_subscribe_locked();
    void send_advertise_locked();

    Ros& ros_;
    std::string name_;
    std::string message_type_;
    TopicOptions options_;

    mutable std::mutex mutex_;
    std::optional<std::string> subscribe_id_;
    std::optional<std::string> advertise_id_;
    SentFlag subscribe_sent_;
    SentFlag advertise_sent_;
    Ros::Listener message_listener_;
    Ros::Listener close_listener_;

    // Close listener and delayed re-registration run only while the topic is alive
    LifetimeGuard guard_;
};

} // namespace roslink

#endif // ROSLINK_TOPIC_HPP
