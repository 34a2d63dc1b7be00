#ifndef ROSLINK_EVENT_EMITTER_HPP
#define ROSLINK_EVENT_EMITTER_HPP

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace roslink {

using json = nlohmann::json;

namespace events {
    constexpr const char* READY = "ready";
    constexpr const char* CLOSE = "close";
    constexpr const char* CLOSING = "closing";
    constexpr const char* ERROR = "error";
    constexpr const char* STATUS = "status";
}

// Named-event register. Listeners are identified by their handle, so
// registering a handle twice under one event is a no-op, as is removing one
// that was never registered.
//
// Listeners run on the emitting thread, outside the register's lock, so they
// may add or remove listeners themselves. A listener that throws is logged and
// reported through the "error" event; the remaining listeners still run.
class EventEmitter {
public:
    using Callback = std::function<void(const json&)>;
    using Listener = std::shared_ptr<const Callback>;

    static Listener make_listener(Callback cb);

    EventEmitter() = default;
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    void on(const std::string& event, const Listener& listener);
    Listener on(const std::string& event, Callback cb);

    // Removed before it runs, so it fires at most once
    void once(const std::string& event, const Listener& listener);
    Listener once(const std::string& event, Callback cb);

    void off(const std::string& event, const Listener& listener);
    void remove_all_listeners(const std::string& event);
    void remove_all_listeners();

    // Returns true if at least one listener was attached to the event
    bool emit(const std::string& event, const json& payload = json());

    size_t listener_count(const std::string& event) const;

private:
    struct Entry {
        Listener listener;
        bool once;
    };

    void add(const std::string& event, const Listener& listener, bool once);
    void report_failure(const std::string& event, const std::string& what);

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Entry>> events_;
};

} // namespace roslink

#endif // ROSLINK_EVENT_EMITTER_HPP
