#include <scenesync/auth.hpp>

#include <fstream>
#include <stdexcept>

namespace scenesync {

auto split_room_id(const RoomId& room) -> std::optional<std::pair<std::string, std::string>> {
    auto colon = room.rfind(':');
    if (colon == RoomId::npos || colon == 0 || colon + 1 == room.size()) return std::nullopt;
    return std::pair{room.substr(0, colon), room.substr(colon + 1)};
}

void StaticAuthorizer::grant(const std::string& token, Identity identity, const std::string& site,
                             const std::string& version) {
    auto& g = grants_[token];
    g.identity = std::move(identity);
    g.sites[site].insert(version);
}

void StaticAuthorizer::add_document(const RoomId& document) {
    if (!documents_) documents_.emplace();
    documents_->insert(document);
}

auto StaticAuthorizer::authorize(std::string_view token, const RoomId& document) -> AuthDecision {
    if (token.empty()) return AuthDecision::deny(AuthFailure::unauthenticated);
    auto it = grants_.find(token);
    if (it == grants_.end()) return AuthDecision::deny(AuthFailure::unauthenticated);

    auto parts = split_room_id(document);
    if (!parts || (documents_ && !documents_->contains(document))) {
        return AuthDecision::deny(AuthFailure::document_not_found);
    }
    const auto& [site, version] = *parts;
    auto site_it = it->second.sites.find(site);
    if (site_it == it->second.sites.end() ||
        (!site_it->second.contains("*") && !site_it->second.contains(version))) {
        return AuthDecision::deny(AuthFailure::unauthorized);
    }
    return AuthDecision::allow(it->second.identity);
}

// -- Loading ------------------------------------------------------------------

auto StaticAuthorizer::from_json(const nlohmann::json& j) -> StaticAuthorizer {
    if (!j.is_object()) throw std::runtime_error{"grants: top level must be an object"};
    auto result = StaticAuthorizer{};

    if (auto docs = j.find("documents"); docs != j.end()) {
        if (!docs->is_array()) throw std::runtime_error{"grants: documents must be an array"};
        result.documents_.emplace();
        for (const auto& d : *docs) {
            if (!d.is_string()) throw std::runtime_error{"grants: document ids must be strings"};
            result.documents_->insert(d.get<std::string>());
        }
    }

    auto tokens = j.find("tokens");
    if (tokens == j.end()) return result;
    if (!tokens->is_object()) throw std::runtime_error{"grants: tokens must be an object"};

    for (const auto& [token, entry] : tokens->items()) {
        if (!entry.is_object() || !entry.contains("user_id") || !entry["user_id"].is_string()) {
            throw std::runtime_error{"grants: token " + token + " needs a string user_id"};
        }
        auto g = Grant{};
        g.identity.user_id = entry["user_id"].get<std::string>();
        g.identity.display_name = entry.value("name", std::string{});
        if (auto sites = entry.find("sites"); sites != entry.end()) {
            if (!sites->is_object()) throw std::runtime_error{"grants: sites must be an object"};
            for (const auto& [site, versions] : sites->items()) {
                if (!versions.is_array()) {
                    throw std::runtime_error{"grants: versions of " + site + " must be an array"};
                }
                auto& allowed = g.sites[site];
                for (const auto& v : versions) {
                    if (v.is_string()) {
                        allowed.insert(v.get<std::string>());
                    } else if (v.is_number_integer()) {
                        allowed.insert(std::to_string(v.get<std::int64_t>()));
                    } else {
                        throw std::runtime_error{"grants: bad version for " + site};
                    }
                }
            }
        }
        result.grants_.insert_or_assign(token, std::move(g));
    }
    return result;
}

auto StaticAuthorizer::from_file(const std::filesystem::path& path) -> StaticAuthorizer {
    auto in = std::ifstream{path};
    if (!in) throw std::runtime_error{"grants: cannot open " + path.string()};
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error{"grants: " + path.string() + " is not valid JSON"};
    return from_json(j);
}

}  // namespace scenesync
