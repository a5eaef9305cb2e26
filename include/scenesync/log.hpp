/// @file log.hpp
/// @brief The engine's named spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace scenesync::log {

/// The `scenesync` logger, created on first use (colour stderr sink).
auto get() -> std::shared_ptr<spdlog::logger>;

/// Set the level from a name such as "debug", "info", "warn", "error", "off".
/// Unknown names leave the level unchanged and return false.
auto set_level(std::string_view level) -> bool;

}  // namespace scenesync::log
