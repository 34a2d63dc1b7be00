#ifndef ROSLINK_ROS_HPP
#define ROSLINK_ROS_HPP

#include "config.hpp"
#include "correlation_table.hpp"
#include "event_emitter.hpp"
#include "protocol.hpp"
#include "task_scheduler.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace roslink {

using json = nlohmann::json;

// ============================================================================
// ROS CONNECTION (one logical rosbridge connection)
// ============================================================================
//
// Owns the transport, the request correlation tables and the event register.
// Outbound messages issued while disconnected are queued and flushed, in
// order, on the next ready transition. Replies are matched to their request
// by id; everything else is routed through the event register by topic or
// service name.
//
// Channel objects (Topic, Service, ...) keep a reference to their Ros and must
// be destroyed before it.
class Ros {
public:
    using ReadyCallback = std::function<void()>;
    using ValueCallback = std::function<void(const json&)>;
    using Listener = EventEmitter::Listener;

    explicit Ros(const RosConfig& config = RosConfig());
    Ros(const std::string& host, uint16_t port);

    // Runs the connection over a caller-supplied transport
    Ros(const RosConfig& config, std::unique_ptr<Transport> transport);

    ~Ros();

    // Non-copyable
    Ros(const Ros&) = delete;
    Ros& operator=(const Ros&) = delete;

    // ---- lifecycle --------------------------------------------------------

    // No-op while connected or while an attempt is in flight
    void connect();

    // Connects and blocks until ready. Throws ConnectionTimeoutError.
    void run();
    void run(std::chrono::milliseconds timeout);

    // Connects and blocks until terminate()
    void run_forever();

    // Deliberate close: emits "closing" while still connected, then closes
    // without reconnecting. Waits up to timeout for the "close" event unless
    // called on the transport thread.
    void close();
    void close(std::chrono::milliseconds timeout);

    // Closes and shuts down the scheduler and the transport thread. run_forever()
    // returns only after shutdown completed; concurrent callers wait for it.
    // Pending blocking calls fail with RosBridgeError.
    void terminate();

    bool is_connected() const { return connected_; }
    bool is_connecting() const { return connecting_; }

    const RosConfig& config() const { return config_; }

    // ---- ids --------------------------------------------------------------

    // Monotonic per connection object, starting at 1
    uint64_t next_id() { return ++id_counter_; }

    // "{op}:{name}:{counter}"
    std::string make_id(const std::string& op, const std::string& name);

    // ---- events -----------------------------------------------------------

    void on(const std::string& event, const Listener& listener) { emitter_.on(event, listener); }
    Listener on(const std::string& event, EventEmitter::Callback cb) { return emitter_.on(event, std::move(cb)); }
    void once(const std::string& event, const Listener& listener) { emitter_.once(event, listener); }
    Listener once(const std::string& event, EventEmitter::Callback cb) { return emitter_.once(event, std::move(cb)); }
    void off(const std::string& event, const Listener& listener) { emitter_.off(event, listener); }
    bool emit(const std::string& event, const json& payload = json()) { return emitter_.emit(event, payload); }

    // ---- sending ----------------------------------------------------------

    // Runs callback now if connected, otherwise on the next ready transition.
    // With run_in_background the callback runs on a scheduler worker, which
    // is required for callbacks that block on replies.
    void on_ready(ReadyCallback callback, bool run_in_background = true);

    // Writes now if connected, otherwise queues for the next ready transition
    void send_on_ready(json message);

    // As above. on_committed runs, under the connection state lock, once the
    // message is bound to a live connection: right before it is written. A
    // close observed before on_committed ran means the message is still queued.
    void send_on_ready(json message, std::function<void()> on_committed);

    // The message must carry an "id"
    void call_async_service(json message, ValueCallback on_success, ValueCallback on_error);

    // Throws ServiceError (result == false) or ServiceTimeoutError. Must not be
    // called from the transport thread.
    json call_sync_service(json message);
    json call_sync_service(json message, std::chrono::milliseconds timeout);

    // Bridge-native action goal. on_result/on_error receive
    // {"status": <name>, "values": <values>}; on_feedback receives values.
    void send_action_goal(json message, ValueCallback on_result,
                          ValueCallback on_feedback, ValueCallback on_error);
    void cancel_action_goal(json message);

    // Blocks for the action result. Throws ActionError (result == false) or
    // GoalTimeoutError. Must not be called from the transport thread.
    json call_sync_action(json message, std::chrono::milliseconds timeout,
                          ValueCallback on_feedback = nullptr);

    void set_status_level(const std::string& level, const std::string& id);

    // ---- scheduling -------------------------------------------------------

    bool call_later(std::chrono::milliseconds delay, std::function<void()> callback);
    bool call_in_thread(std::function<void()> callback);

    // ---- rosapi -----------------------------------------------------------

    std::vector<std::string> get_topics();
    std::string get_topic_type(const std::string& topic);
    std::vector<std::string> get_topics_for_type(const std::string& type);
    std::vector<std::string> get_services();
    std::string get_service_type(const std::string& service);
    std::vector<std::string> get_services_for_type(const std::string& type);
    std::vector<std::string> get_nodes();
    json get_node_details(const std::string& node);
    std::vector<std::string> get_params();
    json get_message_details(const std::string& type);
    json get_service_request_details(const std::string& type);
    json get_service_response_details(const std::string& type);
    std::vector<std::string> get_action_servers();

    // ---- introspection ----------------------------------------------------

    size_t pending_service_requests() const { return service_requests_.size(); }
    size_t pending_action_goals() const { return action_requests_.size(); }

    // True on the transport thread, where blocking calls would deadlock
    bool is_io_thread() const;

private:
    struct ServiceHandlers {
        ValueCallback on_success;
        ValueCallback on_error;
    };

    struct ActionHandlers {
        ValueCallback on_result;
        ValueCallback on_feedback;
        ValueCallback on_error;
    };

    struct Dispatcher;

    void init();

    void handle_open();
    void handle_message(const std::string& payload, bool binary);
    void handle_close(const std::string& reason);
    void handle_fail(const std::string& reason);

    void dispatch(const json& envelope);
    void write(const json& message);
    void schedule_reconnect();
    void report_error(const char* kind, const std::string& what);

    json call_rosapi(const std::string& service, const json& args = json::object());

    RosConfig config_;
    std::unique_ptr<Transport> transport_;
    EventEmitter emitter_;
    TaskScheduler scheduler_;

    CorrelationTable<ServiceHandlers> service_requests_;
    CorrelationTable<ActionHandlers> action_requests_;

    std::atomic<uint64_t> id_counter_{0};
    std::atomic<bool> connected_{false};
    std::atomic<bool> connecting_{false};
    std::atomic<bool> user_closed_{false};
    std::atomic<bool> terminating_{false};
    std::atomic<bool> terminated_{false};
    std::thread::id terminating_thread_;
    std::atomic<std::thread::id> io_thread_id_{};

    // Guards connected_ transitions against the ready queue
    mutable std::mutex state_mutex_;
    std::condition_variable state_cond_;
    std::vector<ReadyCallback> ready_queue_;

    std::mutex send_mutex_;

    std::mutex reconnect_mutex_;
    std::chrono::milliseconds reconnect_delay_;
};

} // namespace roslink

#endif // ROSLINK_ROS_HPP
