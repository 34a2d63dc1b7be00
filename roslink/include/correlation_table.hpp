#ifndef ROSLINK_CORRELATION_TABLE_HPP
#define ROSLINK_CORRELATION_TABLE_HPP

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace roslink {

// Outstanding requests keyed by request id. Each entry is handed out by take()
// exactly once; the caller invokes it after the lock has been released.
template<typename Entry>
class CorrelationTable {
public:
    enum class Lookup {
        found,
        abandoned,   // caller gave up waiting; reply is discarded
        unmatched
    };

    void add(const std::string& id, Entry entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(id)) {
            throw std::invalid_argument("Request id already pending: " + id);
        }
        abandoned_.erase(id);
        pending_.emplace(id, std::move(entry));
    }

    // Removes the entry for id and returns it
    Lookup take(const std::string& id, Entry& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            out = std::move(it->second);
            pending_.erase(it);
            return Lookup::found;
        }
        if (abandoned_.erase(id)) {
            return Lookup::abandoned;
        }
        return Lookup::unmatched;
    }

    // Copy of the entry, left in place
    std::optional<Entry> find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return std::nullopt;
        return it->second;
    }

    // Drops the entry of a request nobody waits for any more. Returns false if
    // the reply already took it.
    bool abandon(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.erase(id)) return false;
        abandoned_.insert(id);
        return true;
    }

    bool contains(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(id) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
        abandoned_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> pending_;
    std::unordered_set<std::string> abandoned_;
};

} // namespace roslink

#endif // ROSLINK_CORRELATION_TABLE_HPP
