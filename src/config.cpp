#include <scenesync/config.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace scenesync {

namespace {

template <typename T>
void read_number(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    const bool non_negative = it->is_number_unsigned() ||
                              (it->is_number_integer() && it->get<std::int64_t>() >= 0);
    if (!non_negative) {
        throw std::runtime_error{std::string{"config: "} + key + " must be a non-negative integer"};
    }
    auto v = it->get<std::uint64_t>();
    if (v > std::numeric_limits<T>::max()) {
        throw std::runtime_error{std::string{"config: "} + key + " is out of range"};
    }
    out = static_cast<T>(v);
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    auto count = static_cast<std::uint64_t>(out.count());
    read_number(j, key, count);
    out = std::chrono::milliseconds{static_cast<std::int64_t>(count)};
}

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw std::runtime_error{std::string{"config: "} + key + " must be a string"};
    out = it->get<std::string>();
}

template <typename T>
auto parse_env_number(std::string_view name, const std::string& text) -> T {
    auto value = std::uint64_t{0};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() ||
        value > std::numeric_limits<T>::max()) {
        throw std::runtime_error{"config: invalid " + std::string{name} + "=" + text};
    }
    return static_cast<T>(value);
}

}  // namespace

auto process_env() -> EnvLookup {
    return [](std::string_view name) -> std::optional<std::string> {
        const auto* value = std::getenv(std::string{name}.c_str());
        if (!value || *value == '\0') return std::nullopt;
        return std::string{value};
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (!j.is_object()) throw std::runtime_error{"config: top level must be an object"};
    read_string(j, "bind_address", c.bind_address);
    read_number(j, "port", c.port);
    read_number(j, "io_threads", c.io_threads);
    read_millis(j, "heartbeat_timeout_ms", c.heartbeat_timeout);
    read_millis(j, "room_grace_ms", c.room_grace);
    read_number(j, "rate_limit_per_room", c.rate_limit_per_room);
    read_millis(j, "rate_limit_window_ms", c.rate_limit_window);
    read_millis(j, "presence_idle_after_ms", c.presence_idle_after);
    read_millis(j, "presence_timeout_ms", c.presence_timeout);
    read_millis(j, "presence_interval_ms", c.presence_interval);
    read_string(j, "storage_dir", c.storage_dir);
    read_millis(j, "snapshot_interval_ms", c.snapshot_interval);
    read_number(j, "snapshot_every_ops", c.snapshot_every_ops);
    read_number(j, "retain_generations", c.retain_generations);
    read_millis(j, "retry_initial_ms", c.retry_initial);
    read_millis(j, "retry_max_ms", c.retry_max);
    read_number(j, "max_attempts", c.max_attempts);
    read_string(j, "redis_url", c.redis_url);
    read_string(j, "instance_id", c.instance_id);
    read_number(j, "outbox_limit", c.outbox_limit);
    read_string(j, "grants_file", c.grants_file);
    read_string(j, "log_level", c.log_level);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"bind_address", c.bind_address},
        {"port", c.port},
        {"io_threads", c.io_threads},
        {"heartbeat_timeout_ms", c.heartbeat_timeout.count()},
        {"room_grace_ms", c.room_grace.count()},
        {"rate_limit_per_room", c.rate_limit_per_room},
        {"rate_limit_window_ms", c.rate_limit_window.count()},
        {"presence_idle_after_ms", c.presence_idle_after.count()},
        {"presence_timeout_ms", c.presence_timeout.count()},
        {"presence_interval_ms", c.presence_interval.count()},
        {"storage_dir", c.storage_dir},
        {"snapshot_interval_ms", c.snapshot_interval.count()},
        {"snapshot_every_ops", c.snapshot_every_ops},
        {"retain_generations", c.retain_generations},
        {"retry_initial_ms", c.retry_initial.count()},
        {"retry_max_ms", c.retry_max.count()},
        {"max_attempts", c.max_attempts},
        {"redis_url", c.redis_url},
        {"instance_id", c.instance_id},
        {"outbox_limit", c.outbox_limit},
        {"grants_file", c.grants_file},
        {"log_level", c.log_level},
    };
}

auto load_config(const std::optional<std::filesystem::path>& file, const EnvLookup& env) -> Config {
    auto config = Config{};

    if (file) {
        auto in = std::ifstream{*file};
        if (!in) throw std::runtime_error{"config: cannot open " + file->string()};
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded()) throw std::runtime_error{"config: " + file->string() + " is not valid JSON"};
        from_json(j, config);
    }

    if (auto v = env("PORT")) config.port = parse_env_number<std::uint16_t>("PORT", *v);
    if (auto v = env("SNAPSHOT_INTERVAL_MS")) {
        config.snapshot_interval = std::chrono::milliseconds{
            parse_env_number<std::int64_t>("SNAPSHOT_INTERVAL_MS", *v)};
    }
    if (auto v = env("DOC_TIMEOUT_MS")) {
        config.room_grace = std::chrono::milliseconds{parse_env_number<std::int64_t>("DOC_TIMEOUT_MS", *v)};
    }
    if (auto v = env("REDIS_URL")) config.redis_url = *v;
    if (auto v = env("INSTANCE_ID")) config.instance_id = *v;
    if (auto v = env("RATE_LIMIT_PER_ROOM")) {
        config.rate_limit_per_room = parse_env_number<std::size_t>("RATE_LIMIT_PER_ROOM", *v);
    }
    if (auto v = env("RATE_LIMIT_WINDOW_MS")) {
        config.rate_limit_window = std::chrono::milliseconds{
            parse_env_number<std::int64_t>("RATE_LIMIT_WINDOW_MS", *v)};
    }
    if (auto v = env("STORAGE_DIR")) config.storage_dir = *v;
    if (auto v = env("GRANTS_FILE")) config.grants_file = *v;
    if (auto v = env("LOG_LEVEL")) config.log_level = *v;

    if (config.port == 0) throw std::runtime_error{"config: port must be non-zero"};
    if (config.io_threads == 0) config.io_threads = 1;
    return config;
}

}  // namespace scenesync
