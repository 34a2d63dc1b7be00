#include "ros.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "websocket_transport.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <variant>

namespace roslink {

namespace {

std::vector<std::string> string_list(const json& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end() || !it->is_array()) return {};
    return it->get<std::vector<std::string>>();
}

std::string string_field(const json& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string request_id(const json& message) {
    auto it = message.find("id");
    if (it == message.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument("Request message without \"id\": " + message.dump());
    }
    return it->get<std::string>();
}

// terminate() drops pending entries, which leaves their promise broken
json await_reply(std::future<json>& result, const std::string& id) {
    try {
        return result.get();
    } catch (const std::future_error&) {
        throw RosBridgeError("Connection terminated before a reply to " + id);
    }
}

} // namespace

// Routes one decoded envelope. Replies are taken out of their correlation
// table before any callback runs, so no callback can fire twice.
struct Ros::Dispatcher {
    Ros& ros;

    void operator()(const PublishMessage& m) const {
        ros.emitter_.emit(m.topic, m.msg);
    }

    void operator()(const ServiceResponseMessage& m) const {
        ServiceHandlers handlers;
        switch (ros.service_requests_.take(m.id, handlers)) {
            case CorrelationTable<ServiceHandlers>::Lookup::found:
                if (!m.result) {
                    if (handlers.on_error) handlers.on_error(m.values);
                } else if (handlers.on_success) {
                    handlers.on_success(m.values);
                }
                break;
            case CorrelationTable<ServiceHandlers>::Lookup::abandoned:
                ROSLINK_LOG_DEBUG("Ros") << "Discarding late service response " << m.id;
                break;
            case CorrelationTable<ServiceHandlers>::Lookup::unmatched:
                throw UnmatchedReplyError(m.id);
        }
    }

    void operator()(const ServiceRequestMessage& m) const {
        ros.emitter_.emit(m.service, m.envelope);
    }

    void operator()(const ActionFeedbackMessage& m) const {
        auto handlers = ros.action_requests_.find(m.id);
        if (!handlers) {
            ROSLINK_LOG_DEBUG("Ros") << "Skipping feedback for unknown goal " << m.id;
            return;
        }
        if (handlers->on_feedback) handlers->on_feedback(m.values);
    }

    void operator()(const ActionResultMessage& m) const {
        ActionHandlers handlers;
        switch (ros.action_requests_.take(m.id, handlers)) {
            case CorrelationTable<ActionHandlers>::Lookup::found: {
                ROSLINK_LOG_DEBUG("Ros") << "Received action result with status " << m.status;
                json results = {{"status", goal_status_name(m.status)}, {"values", m.values}};
                if (!m.result) {
                    if (handlers.on_error) handlers.on_error(results);
                } else if (handlers.on_result) {
                    handlers.on_result(results);
                }
                break;
            }
            case CorrelationTable<ActionHandlers>::Lookup::abandoned:
                ROSLINK_LOG_DEBUG("Ros") << "Discarding late action result " << m.id;
                break;
            case CorrelationTable<ActionHandlers>::Lookup::unmatched:
                throw UnmatchedReplyError(m.id);
        }
    }

    void operator()(const StatusMessage& m) const {
        log::Level level = log::Level::debug;
        if (m.level == "error") level = log::Level::error;
        else if (m.level == "warning") level = log::Level::warn;
        else if (m.level == "info") level = log::Level::info;

        ROSLINK_LOG(level, "Ros") << "Bridge status (" << m.level << "): " << m.msg;
        ros.emitter_.emit(events::STATUS, {{"id", m.id}, {"level", m.level}, {"msg", m.msg}});
    }

    void operator()(const UnhandledMessage& m) const {
        throw UnhandledOperationError(m.op);
    }
};

Ros::Ros(const RosConfig& config)
    : config_(config),
      transport_(std::make_unique<WebSocketTransport>(config.url(), config.headers)),
      scheduler_(config.worker_threads),
      reconnect_delay_(config.reconnect_delay) {
    init();
}

Ros::Ros(const std::string& host, uint16_t port)
    : Ros([&] {
          RosConfig config;
          config.host = host;
          config.port = port;
          return config;
      }()) {
}

Ros::Ros(const RosConfig& config, std::unique_ptr<Transport> transport)
    : config_(config),
      transport_(std::move(transport)),
      scheduler_(config.worker_threads),
      reconnect_delay_(config.reconnect_delay) {
    if (!transport_) {
        throw std::invalid_argument("Ros requires a transport");
    }
    init();
}

Ros::~Ros() {
    terminate();
}

void Ros::init() {
    log::set_level(config_.log_level);

    Transport::Handlers handlers;
    handlers.on_open = [this] { handle_open(); };
    handlers.on_message = [this](const std::string& payload, bool binary) { handle_message(payload, binary); };
    handlers.on_close = [this](const std::string& reason) { handle_close(reason); };
    handlers.on_fail = [this](const std::string& reason) { handle_fail(reason); };
    transport_->set_handlers(std::move(handlers));
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Ros::connect() {
    if (terminating_) {
        ROSLINK_LOG_WARN("Ros") << "connect() after terminate() ignored";
        return;
    }
    if (connected_ || connecting_.exchange(true)) return;

    user_closed_ = false;
    transport_->start();

    if (!transport_->connect()) {
        connecting_ = false;
        schedule_reconnect();
    }
}

void Ros::run() {
    run(config_.connect_timeout);
}

void Ros::run(std::chrono::milliseconds timeout) {
    connect();

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!state_cond_.wait_for(lock, timeout, [this] { return connected_.load() || terminated_.load(); })
        || !connected_) {
        throw ConnectionTimeoutError(config_.url());
    }
}

void Ros::run_forever() {
    connect();

    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cond_.wait(lock, [this] { return terminated_.load(); });
}

void Ros::close() {
    close(config_.close_timeout);
}

void Ros::close(std::chrono::milliseconds timeout) {
    if (!connected_) return;

    user_closed_ = true;

    // Dependents still see a live connection here
    emitter_.emit(events::CLOSING);

    transport_->close("Client disconnect");

    if (is_io_thread()) return;

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!state_cond_.wait_for(lock, timeout, [this] { return !connected_.load(); })) {
        ROSLINK_LOG_WARN("Ros") << "Close handshake did not complete within " << timeout.count() << " ms";
    }
}

void Ros::terminate() {
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (terminating_) {
            // Re-entered from the terminating thread itself (e.g. a "closing" listener)
            if (terminating_thread_ == std::this_thread::get_id()) return;
            state_cond_.wait(lock, [this] { return terminated_.load(); });
            return;
        }
        terminating_ = true;
        terminating_thread_ = std::this_thread::get_id();
    }

    close();

    scheduler_.stop();
    transport_->stop();

    // Nothing can answer these any more; blocking callers fail with RosBridgeError
    service_requests_.clear();
    action_requests_.clear();

    // Notified under the lock: a woken run_forever() may destroy this object
    std::lock_guard<std::mutex> lock(state_mutex_);
    terminated_ = true;
    state_cond_.notify_all();
}

bool Ros::is_io_thread() const {
    return io_thread_id_.load() == std::this_thread::get_id();
}

std::string Ros::make_id(const std::string& op, const std::string& name) {
    return make_request_id(op, name, next_id());
}

// ============================================================================
// TRANSPORT EVENTS
// ============================================================================

void Ros::handle_open() {
    io_thread_id_ = std::this_thread::get_id();
    connecting_ = false;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnect_delay_ = config_.reconnect_delay;
    }

    // Flush until empty; connected_ flips only afterwards so that messages
    // queued before the transition reach the wire first.
    while (true) {
        std::vector<ReadyCallback> pending;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (ready_queue_.empty()) {
                connected_ = true;
                break;
            }
            pending.swap(ready_queue_);
        }
        for (auto& callback : pending) {
            try {
                callback();
            } catch (const std::exception& e) {
                ROSLINK_LOG_ERROR("Ros") << "Ready callback failed: " << e.what();
            }
        }
    }
    state_cond_.notify_all();

    ROSLINK_LOG_INFO("Ros") << "Connection to " << config_.url() << " ready";
    emitter_.emit(events::READY);
}

void Ros::handle_message(const std::string& payload, bool binary) {
    io_thread_id_ = std::this_thread::get_id();

    try {
        if (binary) {
            throw ProtocolError("Binary frames are not supported");
        }
        ROSLINK_LOG_DEBUG("Ros") << "Received " << payload;
        dispatch(decode(payload));
    } catch (const UnhandledOperationError& e) {
        report_error("UnhandledOperationError", e.what());
    } catch (const ProtocolError& e) {
        report_error("ProtocolError", e.what());
    } catch (const UnmatchedReplyError& e) {
        report_error("UnmatchedReplyError", e.what());
    } catch (const std::exception& e) {
        // Raised by a reply callback; the message is skipped
        report_error("CallbackError", e.what());
    }
}

void Ros::handle_close(const std::string& reason) {
    io_thread_id_ = std::this_thread::get_id();
    const bool user_initiated = user_closed_;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connected_ = false;
        connecting_ = false;
    }
    state_cond_.notify_all();

    emitter_.emit(events::CLOSE, {{"reason", reason}, {"user_initiated", user_initiated}});

    if (!user_initiated) {
        schedule_reconnect();
    }
}

void Ros::handle_fail(const std::string& reason) {
    io_thread_id_ = std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connected_ = false;
        connecting_ = false;
    }
    state_cond_.notify_all();

    emitter_.emit(events::CLOSE, {{"reason", reason}, {"user_initiated", false}});
    schedule_reconnect();
}

void Ros::schedule_reconnect() {
    if (!config_.reconnect || terminating_ || user_closed_) return;

    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        delay = reconnect_delay_;
        reconnect_delay_ = std::min(reconnect_delay_ * 2, config_.max_reconnect_delay);
    }

    ROSLINK_LOG_INFO("Ros") << "Connection lost, reconnecting in " << delay.count() << " ms";
    scheduler_.post_after(delay, [this] {
        if (!user_closed_ && !terminating_) connect();
    });
}

void Ros::dispatch(const json& envelope) {
    std::visit(Dispatcher{*this}, parse_inbound(envelope));
}

void Ros::report_error(const char* kind, const std::string& what) {
    ROSLINK_LOG_ERROR("Ros") << kind << ": " << what;
    emitter_.emit(events::ERROR, {{"error", kind}, {"what", what}});
}

// ============================================================================
// SENDING
// ============================================================================

void Ros::write(const json& message) {
    const std::string payload = encode(message);
    ROSLINK_LOG_DEBUG("Ros") << "Sending " << payload;

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!transport_->send(payload)) {
        ROSLINK_LOG_ERROR("Ros") << "Failed to send message: " << payload;
    }
}

void Ros::on_ready(ReadyCallback callback, bool run_in_background) {
    ReadyCallback task = callback;
    if (run_in_background) {
        task = [this, callback] {
            if (!scheduler_.post(callback)) {
                ROSLINK_LOG_WARN("Ros") << "Scheduler stopped; ready callback dropped";
            }
        };
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!connected_) {
            ready_queue_.push_back(std::move(task));
            return;
        }
    }
    task();
}

void Ros::send_on_ready(json message) {
    on_ready([this, message = std::move(message)] { write(message); }, false);
}

void Ros::send_on_ready(json message, std::function<void()> on_committed) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!connected_) {
            // Flushed on the transport thread before connected_ flips, so no
            // close can slip in between on_committed and the write
            ready_queue_.push_back([this, message = std::move(message), on_committed] {
                {
                    std::lock_guard<std::mutex> state_lock(state_mutex_);
                    if (on_committed) on_committed();
                }
                write(message);
            });
            return;
        }
        if (on_committed) on_committed();
    }
    write(message);
}

void Ros::call_async_service(json message, ValueCallback on_success, ValueCallback on_error) {
    const std::string id = request_id(message);
    service_requests_.add(id, ServiceHandlers{std::move(on_success), std::move(on_error)});
    send_on_ready(std::move(message));
}

json Ros::call_sync_service(json message) {
    return call_sync_service(std::move(message), config_.service_timeout);
}

json Ros::call_sync_service(json message, std::chrono::milliseconds timeout) {
    if (is_io_thread()) {
        throw RosBridgeError("Blocking service call issued from the transport thread");
    }

    const std::string id = request_id(message);
    const std::string service = string_field(message, "service");

    auto promise = std::make_shared<std::promise<json>>();
    std::future<json> result = promise->get_future();

    call_async_service(
        std::move(message),
        [promise](const json& values) { promise->set_value(values); },
        [promise](const json& values) { promise->set_exception(std::make_exception_ptr(ServiceError(values))); });

    if (result.wait_for(timeout) == std::future_status::timeout) {
        // If the reply won the race its callback is already completing the future
        if (service_requests_.abandon(id)) {
            throw ServiceTimeoutError(service);
        }
    }
    return await_reply(result, id);
}

void Ros::send_action_goal(json message, ValueCallback on_result,
                           ValueCallback on_feedback, ValueCallback on_error) {
    const std::string id = request_id(message);
    action_requests_.add(id, ActionHandlers{std::move(on_result), std::move(on_feedback), std::move(on_error)});
    send_on_ready(std::move(message));
}

json Ros::call_sync_action(json message, std::chrono::milliseconds timeout, ValueCallback on_feedback) {
    if (is_io_thread()) {
        throw RosBridgeError("Blocking action goal issued from the transport thread");
    }

    const std::string id = request_id(message);

    auto promise = std::make_shared<std::promise<json>>();
    std::future<json> result = promise->get_future();

    send_action_goal(
        std::move(message),
        [promise](const json& results) { promise->set_value(results); },
        std::move(on_feedback),
        [promise](const json& results) { promise->set_exception(std::make_exception_ptr(ActionError(results))); });

    if (result.wait_for(timeout) == std::future_status::timeout) {
        if (action_requests_.abandon(id)) {
            throw GoalTimeoutError(id);
        }
    }
    return await_reply(result, id);
}

void Ros::cancel_action_goal(json message) {
    send_on_ready(std::move(message));
}

void Ros::set_status_level(const std::string& level, const std::string& id) {
    send_on_ready(envelope::set_level(level, id));
}

bool Ros::call_later(std::chrono::milliseconds delay, std::function<void()> callback) {
    return scheduler_.post_after(delay, std::move(callback));
}

bool Ros::call_in_thread(std::function<void()> callback) {
    return scheduler_.post(std::move(callback));
}

// ============================================================================
// ROSAPI
// ============================================================================

json Ros::call_rosapi(const std::string& service, const json& args) {
    const std::string name = "/rosapi/" + service;
    return call_sync_service(envelope::call_service(make_id(ops::CALL_SERVICE, name), name, args));
}

std::vector<std::string> Ros::get_topics() {
    return string_list(call_rosapi("topics"), "topics");
}

std::string Ros::get_topic_type(const std::string& topic) {
    return string_field(call_rosapi("topic_type", {{"topic", topic}}), "type");
}

std::vector<std::string> Ros::get_topics_for_type(const std::string& type) {
    return string_list(call_rosapi("topics_for_type", {{"type", type}}), "topics");
}

std::vector<std::string> Ros::get_services() {
    return string_list(call_rosapi("services"), "services");
}

std::string Ros::get_service_type(const std::string& service) {
    return string_field(call_rosapi("service_type", {{"service", service}}), "type");
}

std::vector<std::string> Ros::get_services_for_type(const std::string& type) {
    return string_list(call_rosapi("services_for_type", {{"type", type}}), "services");
}

std::vector<std::string> Ros::get_nodes() {
    return string_list(call_rosapi("nodes"), "nodes");
}

json Ros::get_node_details(const std::string& node) {
    return call_rosapi("node_details", {{"node", node}});
}

std::vector<std::string> Ros::get_params() {
    return string_list(call_rosapi("get_param_names"), "names");
}

json Ros::get_message_details(const std::string& type) {
    return call_rosapi("message_details", {{"type", type}});
}

json Ros::get_service_request_details(const std::string& type) {
    return call_rosapi("service_request_details", {{"type", type}});
}

json Ros::get_service_response_details(const std::string& type) {
    return call_rosapi("service_response_details", {{"type", type}});
}

std::vector<std::string> Ros::get_action_servers() {
    return string_list(call_rosapi("action_servers"), "action_servers");
}

} // namespace roslink
