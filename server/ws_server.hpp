#pragma once

// WebSocket and HTTP front end of the sync server (Boost.Beast).
//
// One listener accepts TCP connections. Each connection reads an HTTP
// request: `/ws/:siteId/:version` upgrades to a WebSocket session driven by
// the SessionManager, other paths are answered by the status endpoints.

#include <scenesync/blob_store.hpp>
#include <scenesync/fanout_bus.hpp>
#include <scenesync/session_manager.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace scenesync::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

/// What the HTTP handlers and sessions share.
struct ServerContext {
    SessionManager& manager;
    FanoutBus& bus;
    BlobStore& store;
    std::size_t max_queued_frames{4096};
};

/// `/ws/<site>/<version>` -> `<site>:<version>`, or nullopt.
auto room_from_path(std::string_view target) -> std::optional<RoomId>;

/// Answer a plain HTTP request.
auto handle_http(const ServerContext& ctx, const http::request<http::string_body>& req)
    -> http::response<http::string_body>;

/// A WebSocket connection bound to the manager.
class WsConnection : public Connection, public std::enable_shared_from_this<WsConnection> {
public:
    WsConnection(tcp::socket&& socket, ServerContext& ctx, RoomId room, std::string peer);

    /// Accept the upgrade carried by `req` and start reading.
    void run(http::request<http::string_body> req);

    void send(const Frame& frame) override;
    void close(std::uint16_t code, std::string_view reason) override;

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_text(std::string_view text);
    void enqueue(std::string text);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);
    void do_close();
    void finish();

    websocket::stream<beast::tcp_stream> ws_;
    ServerContext& ctx_;
    RoomId room_;
    std::string peer_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;
    bool writing_{false};
    bool closing_{false};
    bool finished_{false};
    websocket::close_reason close_reason_;
    std::shared_ptr<Session> session_;
};

/// Reads HTTP requests from one TCP connection.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, ServerContext& ctx);
    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes);

    beast::tcp_stream stream_;
    ServerContext& ctx_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
};

/// Accepts TCP connections.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    /// @throws boost::system::system_error if the endpoint cannot be bound.
    Listener(asio::io_context& ioc, const tcp::endpoint& endpoint, ServerContext& ctx);
    void run();
    void stop();

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    ServerContext& ctx_;
};

}  // namespace scenesync::server
