#include "event_emitter.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>

namespace roslink {

EventEmitter::Listener EventEmitter::make_listener(Callback cb) {
    if (!cb) {
        throw std::invalid_argument("Listener callback is empty");
    }
    return std::make_shared<const Callback>(std::move(cb));
}

void EventEmitter::on(const std::string& event, const Listener& listener) {
    add(event, listener, false);
}

EventEmitter::Listener EventEmitter::on(const std::string& event, Callback cb) {
    Listener listener = make_listener(std::move(cb));
    add(event, listener, false);
    return listener;
}

void EventEmitter::once(const std::string& event, const Listener& listener) {
    add(event, listener, true);
}

EventEmitter::Listener EventEmitter::once(const std::string& event, Callback cb) {
    Listener listener = make_listener(std::move(cb));
    add(event, listener, true);
    return listener;
}

void EventEmitter::add(const std::string& event, const Listener& listener, bool once) {
    if (!listener) {
        throw std::invalid_argument("Listener handle is null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = events_[event];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& e) { return e.listener == listener; });
    if (it == entries.end()) {
        entries.push_back({listener, once});
    }
}

void EventEmitter::off(const std::string& event, const Listener& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = events_.find(event);
    if (found == events_.end()) return;

    auto& entries = found->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const Entry& e) { return e.listener == listener; }),
                  entries.end());
    if (entries.empty()) {
        events_.erase(found);
    }
}

void EventEmitter::remove_all_listeners(const std::string& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.erase(event);
}

void EventEmitter::remove_all_listeners() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

bool EventEmitter::emit(const std::string& event, const json& payload) {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = events_.find(event);
        if (found == events_.end()) return false;

        auto& entries = found->second;
        snapshot.reserve(entries.size());
        for (const auto& entry : entries) {
            snapshot.push_back(entry.listener);
        }
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const Entry& e) { return e.once; }),
                      entries.end());
        if (entries.empty()) {
            events_.erase(found);
        }
    }

    for (const auto& listener : snapshot) {
        try {
            (*listener)(payload);
        } catch (const std::exception& e) {
            report_failure(event, e.what());
        }
    }
    return !snapshot.empty();
}

void EventEmitter::report_failure(const std::string& event, const std::string& what) {
    ROSLINK_LOG_ERROR("EventEmitter") << "Listener for \"" << event << "\" threw: " << what;

    // A failing error listener is only logged
    if (event != events::ERROR) {
        emit(events::ERROR, {{"event", event}, {"what", what}});
    }
}

size_t EventEmitter::listener_count(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = events_.find(event);
    return found == events_.end() ? 0 : found->second.size();
}

} // namespace roslink
