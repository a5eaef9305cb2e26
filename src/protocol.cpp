#include <scenesync/protocol.hpp>

#include <scenesync/scene_json.hpp>

#include <utility>

namespace scenesync {

namespace {

[[noreturn]] void invalid(std::string message) {
    throw Exception{ErrorKind::invalid_frame, std::move(message)};
}

auto parse_error_kind(std::string_view s) -> std::optional<ErrorKind> {
    for (auto kind : {ErrorKind::auth_rejected, ErrorKind::validation_rejected,
                      ErrorKind::transient_storage, ErrorKind::fanout_unavailable,
                      ErrorKind::corrupt_snapshot, ErrorKind::invalid_frame,
                      ErrorKind::decoding_error}) {
        if (to_string_view(kind) == s) return kind;
    }
    return std::nullopt;
}

auto text(const nlohmann::json& j, const char* key, bool required = true) -> std::string {
    auto it = j.find(key);
    if (it == j.end()) {
        if (required) invalid(std::string{"missing \""} + key + "\"");
        return {};
    }
    if (!it->is_string()) invalid(std::string{"\""} + key + "\" must be a string");
    return it->get<std::string>();
}

auto sessions_to_json(const std::map<SessionId, nlohmann::json>& sessions) -> nlohmann::json {
    auto out = nlohmann::json::object();
    for (const auto& [id, entry] : sessions) out[id.to_hex()] = entry;
    return out;
}

auto sessions_from_json(const nlohmann::json& j) -> std::map<SessionId, nlohmann::json> {
    if (!j.is_object()) invalid("sessions must be an object");
    auto out = std::map<SessionId, nlohmann::json>{};
    for (const auto& [hex, entry] : j.items()) {
        auto id = SessionId::from_hex(hex);
        if (!id) invalid("bad session id " + hex);
        out.emplace(*id, entry);
    }
    return out;
}

auto ops_from_json(const nlohmann::json& j) -> std::vector<Op> {
    if (!j.is_array()) invalid("ops must be an array");
    return j.get<std::vector<Op>>();
}

void write_frame(nlohmann::json& j, const Frame& frame) {
    j = nlohmann::json{{"type", std::string{frame_type(frame)}}};
    std::visit(overload{
        [&](const ConnectFrame& f) {
            j["token"] = f.token;
            j["document"] = f.document;
            if (f.resume) {
                j["resume"] = {{"session_id", f.resume->session_id},
                               {"watermark", f.resume->watermark}};
            }
            if (!f.user.is_null()) j["user"] = f.user;
        },
        [&](const AcceptFrame& f) {
            j["session_id"] = f.session_id;
            j["mode"] = f.mode == SyncMode::full ? "full" : "delta";
            if (f.state) j["state"] = *f.state;
            if (f.mode == SyncMode::delta) j["ops"] = f.ops;
            j["watermark"] = f.watermark;
            j["presence"] = sessions_to_json(f.presence);
        },
        [&](const RejectFrame& f) {
            j["code"] = std::string{to_string_view(f.code)};
            j["message"] = f.message;
            if (f.retry_after) j["retry_after_ms"] = f.retry_after->count();
        },
        [&](const OperationFrame& f) { j["ops"] = f.ops; },
        [&](const PresenceFrame& f) {
            if (f.state) {
                j["state"] = *f.state;
                return;
            }
            j["sessions"] = sessions_to_json(f.sessions);
            if (!f.removed.empty()) j["removed"] = f.removed;
        },
        [&](const AckFrame& f) { j["watermark"] = f.watermark; },
        [](const PingFrame&) {},
        [](const PongFrame&) {},
        [&](const RoomClosingFrame& f) { j["reason"] = f.reason; },
        [&](const DegradedFrame& f) { j["read_only"] = f.read_only; },
        [&](const ErrorFrame& f) {
            j["code"] = std::string{to_string_view(f.code)};
            j["message"] = f.message;
        },
    }, frame);
}

auto read_frame(const nlohmann::json& j) -> Frame {
    if (!j.is_object()) invalid("frame must be an object");
    auto type = text(j, "type");

    if (type == "connect") {
        auto f = ConnectFrame{.token = text(j, "token", false), .document = text(j, "document")};
        if (auto r = j.find("resume"); r != j.end() && !r->is_null()) {
            if (!r->is_object() || !r->contains("session_id")) invalid("bad resume");
            f.resume = Resume{.session_id = r->at("session_id").get<SessionId>(),
                              .watermark = r->value("watermark", nlohmann::json::object())
                                               .get<Watermark>()};
        }
        if (auto u = j.find("user"); u != j.end() && !u->is_null()) {
            if (!u->is_object()) invalid("user must be an object");
            f.user = *u;
        }
        return f;
    }
    if (type == "accept") {
        auto f = AcceptFrame{.session_id = j.at("session_id").get<SessionId>()};
        auto mode = text(j, "mode");
        if (mode == "full") {
            f.mode = SyncMode::full;
        } else if (mode == "delta") {
            f.mode = SyncMode::delta;
        } else {
            invalid("bad mode " + mode);
        }
        if (auto s = j.find("state"); s != j.end()) f.state = s->get<SceneState>();
        if (auto o = j.find("ops"); o != j.end()) f.ops = ops_from_json(*o);
        f.watermark = j.at("watermark").get<Watermark>();
        if (auto p = j.find("presence"); p != j.end()) f.presence = sessions_from_json(*p);
        return f;
    }
    if (type == "reject") {
        auto code = parse_reject_code(text(j, "code"));
        if (!code) invalid("bad reject code");
        auto f = RejectFrame{.code = *code, .message = text(j, "message", false)};
        if (auto r = j.find("retry_after_ms"); r != j.end()) {
            if (!r->is_number_integer()) invalid("retry_after_ms must be an integer");
            f.retry_after = std::chrono::milliseconds{r->get<std::int64_t>()};
        }
        return f;
    }
    if (type == "operation") {
        if (!j.contains("ops")) invalid("missing \"ops\"");
        return OperationFrame{.ops = ops_from_json(j["ops"])};
    }
    if (type == "presence") {
        auto f = PresenceFrame{};
        if (auto s = j.find("state"); s != j.end()) {
            if (!s->is_object()) invalid("presence state must be an object");
            f.state = *s;
            return f;
        }
        if (auto s = j.find("sessions"); s != j.end()) f.sessions = sessions_from_json(*s);
        if (auto r = j.find("removed"); r != j.end()) f.removed = r->get<std::vector<SessionId>>();
        return f;
    }
    if (type == "ack") {
        if (!j.contains("watermark")) invalid("missing \"watermark\"");
        return AckFrame{.watermark = j["watermark"].get<Watermark>()};
    }
    if (type == "ping") return PingFrame{};
    if (type == "pong") return PongFrame{};
    if (type == "room_closing") return RoomClosingFrame{.reason = text(j, "reason", false)};
    if (type == "degraded") return DegradedFrame{.read_only = j.value("read_only", true)};
    if (type == "error") {
        auto code = parse_error_kind(text(j, "code"));
        if (!code) invalid("bad error code");
        return ErrorFrame{.code = *code, .message = text(j, "message", false)};
    }
    invalid("unknown frame type " + type);
}

}  // anonymous namespace

auto frame_type(const Frame& frame) -> std::string_view {
    return std::visit(overload{
        [](const ConnectFrame&) { return std::string_view{"connect"}; },
        [](const AcceptFrame&) { return std::string_view{"accept"}; },
        [](const RejectFrame&) { return std::string_view{"reject"}; },
        [](const OperationFrame&) { return std::string_view{"operation"}; },
        [](const PresenceFrame&) { return std::string_view{"presence"}; },
        [](const AckFrame&) { return std::string_view{"ack"}; },
        [](const PingFrame&) { return std::string_view{"ping"}; },
        [](const PongFrame&) { return std::string_view{"pong"}; },
        [](const RoomClosingFrame&) { return std::string_view{"room_closing"}; },
        [](const DegradedFrame&) { return std::string_view{"degraded"}; },
        [](const ErrorFrame&) { return std::string_view{"error"}; },
    }, frame);
}

void frame_to_json(nlohmann::json& j, const Frame& frame) {
    write_frame(j, frame);
}

void frame_from_json(const nlohmann::json& j, Frame& frame) {
    try {
        frame = read_frame(j);
    } catch (const Exception& e) {
        if (e.kind() == ErrorKind::invalid_frame) throw;
        invalid(e.what());
    } catch (const nlohmann::json::exception& e) {
        invalid(e.what());
    }
}

auto serialize_frame(const Frame& frame) -> std::string {
    auto j = nlohmann::json{};
    frame_to_json(j, frame);
    return j.dump();
}

auto parse_frame(std::string_view text) -> Frame {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) invalid("frame is not valid JSON");
    auto frame = Frame{};
    frame_from_json(j, frame);
    return frame;
}

}  // namespace scenesync
