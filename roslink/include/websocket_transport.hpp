#ifndef ROSLINK_WEBSOCKET_TRANSPORT_HPP
#define ROSLINK_WEBSOCKET_TRANSPORT_HPP

#include "transport.hpp"

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace roslink {

using websocketpp::connection_hdl;
typedef websocketpp::client<websocketpp::config::asio_client> WsClient;

// websocketpp client running its asio loop on a dedicated thread. The loop is
// kept alive between connections so reconnects reuse the same thread.
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(const std::string& uri,
                                std::map<std::string, std::string> headers = {});
    ~WebSocketTransport() override;

    // Non-copyable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void set_handlers(Handlers handlers) override;
    void start() override;
    void stop() override;
    bool connect() override;
    bool send(const std::string& payload) override;
    void close(const std::string& reason) override;

private:
    void on_open(connection_hdl hdl);
    void on_close(connection_hdl hdl);
    void on_fail(connection_hdl hdl);
    void on_message(connection_hdl hdl, WsClient::message_ptr msg);

    std::string uri_;
    std::map<std::string, std::string> headers_;
    WsClient client_;
    Handlers handlers_;

    std::mutex connection_mutex_;
    connection_hdl connection_;

    std::atomic<bool> running_;
    std::thread io_thread_;
};

} // namespace roslink

#endif // ROSLINK_WEBSOCKET_TRANSPORT_HPP
