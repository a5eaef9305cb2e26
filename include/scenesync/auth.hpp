/// @file auth.hpp
/// @brief Identity and authorization collaborator.

#pragma once

#include <scenesync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace scenesync {

/// The authenticated user behind a connection.
struct Identity {
    std::string user_id;
    std::string display_name;  ///< May be empty.

    auto operator==(const Identity&) const -> bool = default;
};

/// Why an authorization request was refused.
enum class AuthFailure : std::uint8_t {
    unauthenticated,     ///< Missing, unknown or expired credential.
    unauthorized,        ///< Valid credential without access to the document.
    document_not_found,  ///< The document does not exist.
};

constexpr auto to_string_view(AuthFailure failure) noexcept -> std::string_view {
    switch (failure) {
        case AuthFailure::unauthenticated:    return "unauthenticated";
        case AuthFailure::unauthorized:       return "unauthorized";
        case AuthFailure::document_not_found: return "document_not_found";
    }
    return "unknown";
}

/// Outcome of Authorizer::authorize(): an identity or a failure.
struct AuthDecision {
    std::optional<Identity> identity;
    AuthFailure failure{AuthFailure::unauthenticated};  ///< Meaningful when !identity.

    static auto allow(Identity id) -> AuthDecision { return {.identity = std::move(id)}; }
    static auto deny(AuthFailure f) -> AuthDecision { return {.failure = f}; }

    explicit operator bool() const { return identity.has_value(); }
};

/// Resolves a credential to an identity with access to a document.
///
/// Implementations may block (they typically call an external service), so
/// callers must not hold room locks while calling authorize().
class Authorizer {
public:
    virtual ~Authorizer() = default;

    /// Decide whether `token` may edit `document` (`<site>:<version>`).
    virtual auto authorize(std::string_view token, const RoomId& document) -> AuthDecision = 0;
};

/// Token grants held in memory, typically loaded from a JSON file:
///
/// @code{.json}
/// {
///   "documents": ["site_42:3"],
///   "tokens": {
///     "tok-alice": {"user_id": "alice", "name": "Alice", "sites": {"site_42": ["*"]}}
///   }
/// }
/// @endcode
///
/// A grant lists versions per site, or `"*"` for every version. When
/// `documents` is present, documents outside it are reported as not found;
/// otherwise every document exists.
class StaticAuthorizer : public Authorizer {
public:
    struct Grant {
        Identity identity;
        std::map<std::string, std::set<std::string>> sites;  ///< site -> versions or "*".
    };

    StaticAuthorizer() = default;

    /// Allow `token` to edit every version of `site` (adds to existing grants).
    void grant(const std::string& token, Identity identity, const std::string& site,
               const std::string& version = "*");

    /// Restrict existing documents to an explicit set.
    void add_document(const RoomId& document);

    auto authorize(std::string_view token, const RoomId& document) -> AuthDecision override;

    /// @throws std::runtime_error on a malformed grants document.
    static auto from_json(const nlohmann::json& j) -> StaticAuthorizer;

    /// @throws std::runtime_error if the file cannot be read or is malformed.
    static auto from_file(const std::filesystem::path& path) -> StaticAuthorizer;

private:
    std::map<std::string, Grant, std::less<>> grants_;
    std::optional<std::set<RoomId>> documents_;
};

/// Split a room id `<site>:<version>` at its last colon.
/// @return nullopt if either part is empty.
auto split_room_id(const RoomId& room) -> std::optional<std::pair<std::string, std::string>>;

}  // namespace scenesync
