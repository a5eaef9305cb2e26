/// @file config.hpp
/// @brief Server configuration: JSON file plus environment overrides.

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scenesync {

/// Every tunable of the sync server, with production defaults.
struct Config {
    // Transport
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{4100};
    std::size_t io_threads{2};
    std::chrono::milliseconds heartbeat_timeout{60'000};

    // Rooms
    std::chrono::milliseconds room_grace{300'000};  ///< Idle time before an empty room is evicted.
    std::size_t rate_limit_per_room{100};           ///< Connects per peer and room per window.
    std::chrono::milliseconds rate_limit_window{60'000};

    // Presence
    std::chrono::milliseconds presence_idle_after{30'000};
    std::chrono::milliseconds presence_timeout{300'000};
    std::chrono::milliseconds presence_interval{100};

    // Persistence
    std::string storage_dir{"./data"};
    std::chrono::milliseconds snapshot_interval{30'000};
    std::size_t snapshot_every_ops{500};
    std::size_t retain_generations{1};
    std::chrono::milliseconds retry_initial{200};
    std::chrono::milliseconds retry_max{10'000};
    std::size_t max_attempts{6};

    // Fan-out
    std::string redis_url;    ///< Empty: single-process in-memory bus.
    std::string instance_id;  ///< Empty: generated at startup.
    std::size_t outbox_limit{10'000};

    // Auth
    std::string grants_file;  ///< JSON token grants for StaticAuthorizer.

    std::string log_level{"info"};
};

/// Looks up an environment variable.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// The process environment.
auto process_env() -> EnvLookup;

/// @throws std::runtime_error on a value of the wrong type.
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const Config& c);

/// Build the effective configuration.
///
/// Starts from the defaults, applies the JSON file if given, then the
/// environment: `PORT`, `SNAPSHOT_INTERVAL_MS`, `DOC_TIMEOUT_MS`,
/// `REDIS_URL`, `INSTANCE_ID`, `RATE_LIMIT_PER_ROOM`, `RATE_LIMIT_WINDOW_MS`,
/// `STORAGE_DIR`, `GRANTS_FILE`, `LOG_LEVEL`.
/// @throws std::runtime_error if the file cannot be read or a value is invalid.
auto load_config(const std::optional<std::filesystem::path>& file,
                 const EnvLookup& env = process_env()) -> Config;

}  // namespace scenesync
