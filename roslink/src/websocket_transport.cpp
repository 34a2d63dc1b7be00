#include "websocket_transport.hpp"
#include "log.hpp"

namespace roslink {

WebSocketTransport::WebSocketTransport(const std::string& uri,
                                       std::map<std::string, std::string> headers)
    : uri_(uri), headers_(std::move(headers)), running_(false) {

    // Library output goes through our own log lines
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.clear_error_channels(websocketpp::log::elevel::all);

    client_.init_asio();

    client_.set_open_handler(
        std::bind(&WebSocketTransport::on_open, this, std::placeholders::_1));
    client_.set_close_handler(
        std::bind(&WebSocketTransport::on_close, this, std::placeholders::_1));
    client_.set_fail_handler(
        std::bind(&WebSocketTransport::on_fail, this, std::placeholders::_1));
    client_.set_message_handler(
        std::bind(&WebSocketTransport::on_message, this, std::placeholders::_1, std::placeholders::_2));
}

WebSocketTransport::~WebSocketTransport() {
    stop();
}

void WebSocketTransport::set_handlers(Handlers handlers) {
    handlers_ = std::move(handlers);
}

void WebSocketTransport::start() {
    if (running_.exchange(true)) return;

    client_.start_perpetual();
    io_thread_ = std::thread([this] {
        try {
            client_.run();
        } catch (const std::exception& e) {
            ROSLINK_LOG_ERROR("WebSocketTransport") << "I/O loop failed: " << e.what();
        }
    });
}

void WebSocketTransport::stop() {
    if (!running_.exchange(false)) return;

    client_.stop_perpetual();
    client_.stop();
    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
}

bool WebSocketTransport::connect() {
    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = client_.get_connection(uri_, ec);

    if (ec) {
        ROSLINK_LOG_ERROR("WebSocketTransport") << "Connection error: " << ec.message();
        return false;
    }

    for (const auto& [name, value] : headers_) {
        con->append_header(name, value);
    }

    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection_ = con->get_handle();
    }
    client_.connect(con);
    ROSLINK_LOG_DEBUG("WebSocketTransport") << "Connecting to " << uri_;
    return true;
}

bool WebSocketTransport::send(const std::string& payload) {
    connection_hdl hdl;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        hdl = connection_;
    }

    websocketpp::lib::error_code ec;
    client_.send(hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        ROSLINK_LOG_ERROR("WebSocketTransport") << "Send error: " << ec.message();
        return false;
    }
    return true;
}

void WebSocketTransport::close(const std::string& reason) {
    connection_hdl hdl;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        hdl = connection_;
    }

    websocketpp::lib::error_code ec;
    client_.close(hdl, websocketpp::close::status::normal, reason, ec);
    if (ec) {
        ROSLINK_LOG_WARN("WebSocketTransport") << "Close error: " << ec.message();
    }
}

void WebSocketTransport::on_open(connection_hdl hdl) {
    (void)hdl;
    ROSLINK_LOG_INFO("WebSocketTransport") << "Connected to " << uri_;
    if (handlers_.on_open) handlers_.on_open();
}

void WebSocketTransport::on_close(connection_hdl hdl) {
    std::string reason;
    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = client_.get_con_from_hdl(hdl, ec);
    if (!ec && con) {
        reason = con->get_remote_close_reason();
        if (reason.empty()) {
            reason = websocketpp::close::status::get_string(con->get_remote_close_code());
        }
    }

    ROSLINK_LOG_INFO("WebSocketTransport") << "Connection closed: " << reason;
    if (handlers_.on_close) handlers_.on_close(reason);
}

void WebSocketTransport::on_fail(connection_hdl hdl) {
    std::string reason = "unknown";
    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = client_.get_con_from_hdl(hdl, ec);
    if (!ec && con) {
        reason = con->get_ec().message();
    }

    ROSLINK_LOG_WARN("WebSocketTransport") << "Connection failed: " << reason;
    if (handlers_.on_fail) handlers_.on_fail(reason);
}

void WebSocketTransport::on_message(connection_hdl hdl, WsClient::message_ptr msg) {
    (void)hdl;
    const bool binary = msg->get_opcode() == websocketpp::frame::opcode::binary;
    if (handlers_.on_message) handlers_.on_message(msg->get_payload(), binary);
}

} // namespace roslink
