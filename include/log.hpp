#ifndef ROSLINK_LOG_HPP
#define ROSLINK_LOG_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace roslink {
namespace log {

enum class Level {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
    off = 4
};

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::info};
    return level;
}

inline void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }
inline Level level() { return threshold().load(std::memory_order_relaxed); }

inline bool enabled(Level lvl) {
    return lvl >= level() && lvl != Level::off;
}

// Accepts "debug", "info", "warn"/"warning", "error", "off"
inline bool parse_level(const std::string& name, Level& out) {
    if (name == "debug") out = Level::debug;
    else if (name == "info") out = Level::info;
    else if (name == "warn" || name == "warning") out = Level::warn;
    else if (name == "error") out = Level::error;
    else if (name == "off" || name == "none") out = Level::off;
    else return false;
    return true;
}

inline std::mutex& output_mutex() {
    static std::mutex mtx;
    return mtx;
}

// One log line. Collects the message and writes "[component] message" when destroyed.
class Line {
public:
    Line(Level lvl, const char* component) : level_(lvl), component_(component) {}

    ~Line() {
        std::lock_guard<std::mutex> lock(output_mutex());
        std::ostream& out = level_ >= Level::warn ? std::cerr : std::cout;
        out << "[" << component_ << "] " << stream_.str() << std::endl;
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    std::ostringstream& stream() { return stream_; }

private:
    Level level_;
    const char* component_;
    std::ostringstream stream_;
};

} // namespace log
} // namespace roslink

#define ROSLINK_LOG(lvl, component) \
    if (!::roslink::log::enabled(lvl)) {} \
    else ::roslink::log::Line(lvl, component).stream()

#define ROSLINK_LOG_DEBUG(component) ROSLINK_LOG(::roslink::log::Level::debug, component)
#define ROSLINK_LOG_INFO(component) ROSLINK_LOG(::roslink::log::Level::info, component)
#define ROSLINK_LOG_WARN(component) ROSLINK_LOG(::roslink::log::Level::warn, component)
#define ROSLINK_LOG_ERROR(component) ROSLINK_LOG(::roslink::log::Level::error, component)

#endif // ROSLINK_LOG_HPP
