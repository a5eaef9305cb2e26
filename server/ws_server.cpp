#include "ws_server.hpp"

#include <scenesync/log.hpp>
#include <scenesync/protocol.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <utility>

namespace scenesync::server {

namespace {

constexpr const char* server_name = "scenesync";
constexpr const char* server_version = "1.0.0";

auto json_response(const http::request<http::string_body>& req, http::status status,
                   const nlohmann::json& body) -> http::response<http::string_body> {
    auto res = http::response<http::string_body>{status, req.version()};
    res.set(http::field::server, server_name);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

auto storage_ok(BlobStore& store) -> bool {
    try {
        store.list("health/");
        return true;
    } catch (const std::exception& e) {
        log::get()->warn("storage health check failed: {}", e.what());
        return false;
    }
}

auto peer_address(const http::request<http::string_body>& req, const tcp::socket& socket)
    -> std::string {
    if (auto it = req.find("x-forwarded-for"); it != req.end()) {
        auto value = std::string{it->value().data(), it->value().size()};
        auto first = value.substr(0, value.find(','));
        auto b = first.find_first_not_of(' ');
        auto e = first.find_last_not_of(' ');
        if (b != std::string::npos) return first.substr(b, e - b + 1);
    }
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    return ec ? std::string{"unknown"} : endpoint.address().to_string();
}

}  // namespace

auto room_from_path(std::string_view target) -> std::optional<RoomId> {
    target = target.substr(0, target.find('?'));
    constexpr auto prefix = std::string_view{"/ws/"};
    if (!target.starts_with(prefix)) return std::nullopt;
    auto rest = target.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0) return std::nullopt;
    auto site = rest.substr(0, slash);
    auto version = rest.substr(slash + 1);
    if (version.empty() || version.find('/') != std::string_view::npos) return std::nullopt;
    return std::string{site} + ":" + std::string{version};
}

auto handle_http(const ServerContext& ctx, const http::request<http::string_body>& req)
    -> http::response<http::string_body> {
    auto path = std::string_view{req.target().data(), req.target().size()};
    path = path.substr(0, path.find('?'));
    auto now = SessionManager::Clock::now();

    if (req.method() == http::verb::options) {
        auto res = json_response(req, http::status::no_content, nullptr);
        res.body().clear();
        res.prepare_payload();
        return res;
    }

    if (path == "/health" || path == "/ready") {
        auto checks = nlohmann::json{{"storage", storage_ok(ctx.store)}, {"bus", ctx.bus.available()}};
        auto ok = checks["storage"].get<bool>() && checks["bus"].get<bool>();
        auto body = nlohmann::json{{"checks", checks}};
        if (path == "/health") {
            body["status"] = ok ? "healthy" : "unhealthy";
            body["instance"] = ctx.manager.instance_id();
        } else {
            body["status"] = ok ? "ready" : "not_ready";
        }
        return json_response(req, ok ? http::status::ok : http::status::service_unavailable, body);
    }

    if (path == "/rooms") {
        return json_response(req, http::status::ok, ctx.manager.stats(now));
    }

    constexpr auto rooms_prefix = std::string_view{"/rooms/"};
    constexpr auto stats_suffix = std::string_view{"/stats"};
    if (path.starts_with(rooms_prefix) && path.ends_with(stats_suffix) &&
        path.size() > rooms_prefix.size() + stats_suffix.size()) {
        auto room = std::string{path.substr(rooms_prefix.size(),
                                            path.size() - rooms_prefix.size() - stats_suffix.size())};
        if (auto stats = ctx.manager.room_stats(room, now)) {
            return json_response(req, http::status::ok, *stats);
        }
        return json_response(req, http::status::not_found,
                             {{"error", "Room not found"}, {"room", room}});
    }

    if (path == "/") {
        return json_response(req, http::status::ok, {
            {"name", server_name},
            {"version", server_version},
            {"features", {"crdt", "websocket", "presence", "persistence"}},
            {"endpoints", {
                {"websocket", "/ws/:siteId/:version"},
                {"health", "/health"},
                {"ready", "/ready"},
                {"rooms", "/rooms"},
                {"roomStats", "/rooms/:roomId/stats"},
            }},
        });
    }

    return json_response(req, http::status::not_found, {{"error", "Not found"}});
}

// -- WsConnection -------------------------------------------------------------

WsConnection::WsConnection(tcp::socket&& socket, ServerContext& ctx, RoomId room, std::string peer)
    : ws_{std::move(socket)}, ctx_{ctx}, room_{std::move(room)}, peer_{std::move(peer)} {}

void WsConnection::run(http::request<http::string_body> req) {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, server_name);
    }));
    ws_.async_accept(req, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            log::get()->warn("websocket handshake with {} failed: {}", self->peer_, ec.message());
            self->finish();
            return;
        }
        self->do_read();
    });
}

void WsConnection::send(const Frame& frame) {
    asio::post(ws_.get_executor(), [self = shared_from_this(), text = serialize_frame(frame)]() mutable {
        self->enqueue(std::move(text));
    });
}

void WsConnection::close(std::uint16_t code, std::string_view reason) {
    asio::post(ws_.get_executor(),
               [self = shared_from_this(), code, reason = std::string{reason}] {
        if (self->closing_ || self->finished_) return;
        self->closing_ = true;
        self->close_reason_ = websocket::close_reason{static_cast<websocket::close_code>(code), reason};
        if (!self->writing_) self->do_close();
    });
}

void WsConnection::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WsConnection::on_read, shared_from_this()));
}

void WsConnection::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed) {
            log::get()->debug("read from {} ended: {}", peer_, ec.message());
        }
        finish();
        return;
    }
    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (!closing_) {
        try {
            on_text(text);
        } catch (const std::exception& e) {
            log::get()->error("error handling frame from {}: {}", peer_, e.what());
            close(close_code::internal_error, "internal error");
        }
    }
    do_read();
}

void WsConnection::on_text(std::string_view text) {
    auto now = SessionManager::Clock::now();
    if (session_) {
        ctx_.manager.handle_text(session_, text, now);
        return;
    }

    auto frame = Frame{};
    try {
        frame = parse_frame(text);
    } catch (const Exception& e) {
        send(ErrorFrame{.code = e.kind(), .message = e.what()});
        close(close_code::policy_violation, "invalid connect frame");
        return;
    }
    auto* connect = std::get_if<ConnectFrame>(&frame);
    if (!connect) {
        send(ErrorFrame{.code = ErrorKind::invalid_frame, .message = "expected a connect frame"});
        close(close_code::policy_violation, "expected a connect frame");
        return;
    }
    if (connect->document.empty()) connect->document = room_;
    if (connect->document != room_) {
        send(ErrorFrame{.code = ErrorKind::invalid_frame,
                        .message = "document does not match the connection path"});
        close(close_code::policy_violation, "document mismatch");
        return;
    }
    session_ = ctx_.manager.connect(shared_from_this(), *connect, peer_, now);
}

void WsConnection::enqueue(std::string text) {
    if (closing_ || finished_) return;
    if (queue_.size() >= ctx_.max_queued_frames) {
        log::get()->warn("closing {}: {} frames queued", peer_, queue_.size());
        queue_.clear();
        closing_ = true;
        close_reason_ = websocket::close_reason{static_cast<websocket::close_code>(close_code::policy_violation), "send queue overflow"};
        if (!writing_) do_close();
        return;
    }
    queue_.push_back(std::move(text));
    if (!writing_) do_write();
}

void WsConnection::do_write() {
    writing_ = true;
    ws_.text(true);
    ws_.async_write(asio::buffer(queue_.front()),
                    beast::bind_front_handler(&WsConnection::on_write, shared_from_this()));
}

void WsConnection::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        finish();
        return;
    }
    if (!queue_.empty()) queue_.pop_front();
    if (!queue_.empty()) {
        do_write();
    } else if (closing_) {
        do_close();
    }
}

void WsConnection::do_close() {
    ws_.async_close(close_reason_, [self = shared_from_this()](beast::error_code) {
        self->finish();
    });
}

void WsConnection::finish() {
    if (finished_) return;
    finished_ = true;
    queue_.clear();
    if (session_) ctx_.manager.disconnect(std::exchange(session_, nullptr), SessionManager::Clock::now());
}

// -- HttpSession --------------------------------------------------------------

HttpSession::HttpSession(tcp::socket&& socket, ServerContext& ctx)
    : stream_{std::move(socket)}, ctx_{ctx} {}

void HttpSession::run() {
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds{30});
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) return;

    if (websocket::is_upgrade(req_)) {
        auto room = room_from_path(std::string_view{req_.target().data(), req_.target().size()});
        if (room) {
            auto peer = peer_address(req_, stream_.socket());
            log::get()->info("websocket upgrade: room={} peer={}", *room, peer);
            std::make_shared<WsConnection>(stream_.release_socket(), ctx_, std::move(*room),
                                           std::move(peer))
                ->run(std::move(req_));
            return;
        }
    }

    res_ = std::make_shared<http::response<http::string_body>>(handle_http(ctx_, req_));
    http::async_write(stream_, *res_,
                      beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                res_->keep_alive()));
}

void HttpSession::on_write(bool keep_alive, beast::error_code ec, std::size_t) {
    if (ec) return;
    if (!keep_alive) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    res_.reset();
    do_read();
}

// -- Listener -----------------------------------------------------------------

Listener::Listener(asio::io_context& ioc, const tcp::endpoint& endpoint, ServerContext& ctx)
    : ioc_{ioc}, acceptor_{asio::make_strand(ioc)}, ctx_{ctx} {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void Listener::do_accept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted) return;
    if (ec) {
        log::get()->warn("accept failed: {}", ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), ctx_)->run();
    }
    do_accept();
}

}  // namespace scenesync::server
