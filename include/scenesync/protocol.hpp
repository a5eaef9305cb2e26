/// @file protocol.hpp
/// @brief JSON text frames exchanged with editor sessions.
///
/// Every frame is a JSON object with a `type` member. The first client frame
/// is `connect`; the server answers `accept` or `reject`. After that both
/// sides exchange `operation`, `presence`, `ack`, `ping`/`pong`, and the
/// server may send `room_closing`, `degraded` or `error`.

#pragma once

#include <scenesync/document.hpp>
#include <scenesync/error.hpp>
#include <scenesync/op.hpp>
#include <scenesync/types.hpp>
#include <scenesync/watermark.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scenesync {

/// Why a connection was refused.
enum class RejectCode : std::uint8_t {
    unauthenticated,
    unauthorized,
    document_not_found,
    rate_limited,
};

constexpr auto to_string_view(RejectCode code) noexcept -> std::string_view {
    switch (code) {
        case RejectCode::unauthenticated:    return "unauthenticated";
        case RejectCode::unauthorized:       return "unauthorized";
        case RejectCode::document_not_found: return "document_not_found";
        case RejectCode::rate_limited:       return "rate_limited";
    }
    return "unknown";
}

constexpr auto parse_reject_code(std::string_view s) noexcept -> std::optional<RejectCode> {
    if (s == "unauthenticated")    return RejectCode::unauthenticated;
    if (s == "unauthorized")       return RejectCode::unauthorized;
    if (s == "document_not_found") return RejectCode::document_not_found;
    if (s == "rate_limited")       return RejectCode::rate_limited;
    return std::nullopt;
}

/// How the initial state is delivered in an accept frame.
enum class SyncMode : std::uint8_t {
    full,   ///< `state` holds the whole scene.
    delta,  ///< `ops` holds what the session missed since its watermark.
};

// -- Frames -------------------------------------------------------------------

/// Where a reconnecting session left off.
struct Resume {
    SessionId session_id;
    Watermark watermark;
    auto operator==(const Resume&) const -> bool = default;
};

struct ConnectFrame {
    std::string token;
    RoomId document;                 ///< `<site>:<version>`.
    std::optional<Resume> resume;
    nlohmann::json user;             ///< Optional `{name, color}`.
    auto operator==(const ConnectFrame&) const -> bool = default;
};

struct AcceptFrame {
    SessionId session_id;
    SyncMode mode{SyncMode::full};
    std::optional<SceneState> state;              ///< Full mode.
    std::vector<Op> ops;                          ///< Delta mode.
    Watermark watermark;                          ///< The room's watermark.
    std::map<SessionId, nlohmann::json> presence; ///< Everyone already present.
    auto operator==(const AcceptFrame&) const -> bool = default;
};

struct RejectFrame {
    RejectCode code{RejectCode::unauthenticated};
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;  ///< rate_limited only.
    auto operator==(const RejectFrame&) const -> bool = default;
};

struct OperationFrame {
    std::vector<Op> ops;
    auto operator==(const OperationFrame&) const -> bool = default;
};

/// Client: `state` is its own presence. Server: `sessions` changed, `removed` left.
struct PresenceFrame {
    std::optional<nlohmann::json> state;
    std::map<SessionId, nlohmann::json> sessions;
    std::vector<SessionId> removed;
    auto operator==(const PresenceFrame&) const -> bool = default;
};

struct AckFrame {
    Watermark watermark;
    auto operator==(const AckFrame&) const -> bool = default;
};

struct PingFrame {
    auto operator==(const PingFrame&) const -> bool = default;
};

struct PongFrame {
    auto operator==(const PongFrame&) const -> bool = default;
};

struct RoomClosingFrame {
    std::string reason;
    auto operator==(const RoomClosingFrame&) const -> bool = default;
};

struct DegradedFrame {
    bool read_only{true};
    auto operator==(const DegradedFrame&) const -> bool = default;
};

struct ErrorFrame {
    ErrorKind code{ErrorKind::invalid_frame};
    std::string message;
    auto operator==(const ErrorFrame&) const -> bool = default;
};

using Frame = std::variant<
    ConnectFrame,
    AcceptFrame,
    RejectFrame,
    OperationFrame,
    PresenceFrame,
    AckFrame,
    PingFrame,
    PongFrame,
    RoomClosingFrame,
    DegradedFrame,
    ErrorFrame
>;

/// The `type` member written for a frame.
auto frame_type(const Frame& frame) -> std::string_view;

/// Write `frame` as a JSON object with its `type` member.
void frame_to_json(nlohmann::json& j, const Frame& frame);

/// @throws scenesync::Exception (invalid_frame) on an unknown type or bad member.
void frame_from_json(const nlohmann::json& j, Frame& frame);

// ADL hooks for nlohmann. Constrained to Frame itself: a plain `const Frame&`
// overload would be considered for every scenesync type that converts to one
// of the alternatives.
template <std::same_as<Frame> F>
void to_json(nlohmann::json& j, const F& frame) {
    frame_to_json(j, frame);
}

template <std::same_as<Frame> F>
void from_json(const nlohmann::json& j, F& frame) {
    frame_from_json(j, frame);
}

/// Serialize a frame to JSON text.
auto serialize_frame(const Frame& frame) -> std::string;

/// Parse JSON text into a frame.
/// @throws scenesync::Exception (invalid_frame) if the text is not a valid frame.
auto parse_frame(std::string_view text) -> Frame;

}  // namespace scenesync
