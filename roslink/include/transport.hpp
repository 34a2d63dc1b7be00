#ifndef ROSLINK_TRANSPORT_HPP
#define ROSLINK_TRANSPORT_HPP

#include <functional>
#include <string>

namespace roslink {

// Bidirectional message channel the connection manager runs on. All handlers
// are invoked from the transport's own I/O thread.
class Transport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string& payload, bool binary)> on_message;
        std::function<void(const std::string& reason)> on_close;
        std::function<void(const std::string& reason)> on_fail;
    };

    virtual ~Transport() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    // Starts the I/O thread. Idempotent.
    virtual void start() = 0;

    // Stops the I/O thread and joins it
    virtual void stop() = 0;

    // Begins an asynchronous connection attempt. on_open or on_fail follows.
    // Returns false if the attempt could not even be started.
    virtual bool connect() = 0;

    // Writes one text frame. Returns false on failure.
    virtual bool send(const std::string& payload) = 0;

    // Starts the close handshake; on_close follows
    virtual void close(const std::string& reason) = 0;
};

} // namespace roslink

#endif // ROSLINK_TRANSPORT_HPP
