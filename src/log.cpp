#include <scenesync/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace scenesync::log {

namespace {

constexpr auto logger_name = "scenesync";

}  // namespace

auto get() -> std::shared_ptr<spdlog::logger> {
    static std::mutex mutex;
    auto lock = std::lock_guard{mutex};
    if (auto existing = spdlog::get(logger_name)) return existing;
    auto logger = spdlog::stderr_color_mt(logger_name);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

auto set_level(std::string_view level) -> bool {
    auto parsed = spdlog::level::from_str(std::string{level});
    // from_str maps unknown names to off; only accept "off" when asked for.
    if (parsed == spdlog::level::off && level != "off") return false;
    get()->set_level(parsed);
    return true;
}

}  // namespace scenesync::log
