/// @file rate_limiter.hpp
/// @brief Fixed-window connection rate limiting per room and peer.

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace scenesync {

/// Outcome of RateLimiter::allow().
struct RateDecision {
    bool allowed{true};
    std::chrono::milliseconds retry_after{0};  ///< Time until the window resets when denied.
};

/// Counts connection attempts per key in fixed windows.
///
/// The first attempt for a key opens a window of `window` length. Attempts
/// within the window are admitted until `limit` is reached; later ones are
/// denied until the window ends. Keys are `<room>:<peer address>`.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(std::size_t limit, Clock::duration window)
        : limit_{limit}, window_{window} {}

    /// Count one attempt for `key` and decide whether it is admitted.
    auto allow(const std::string& key, Clock::time_point now) -> RateDecision {
        auto lock = std::lock_guard{mutex_};
        auto it = windows_.find(key);
        if (it == windows_.end() || now > it->second.reset_at) {
            windows_[key] = Window{.count = 1, .reset_at = now + window_};
            return {};
        }
        if (it->second.count >= limit_) {
            return RateDecision{
                .allowed = false,
                .retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(
                    it->second.reset_at - now),
            };
        }
        ++it->second.count;
        return {};
    }

    /// Forget windows that have ended. Returns the number dropped.
    auto prune(Clock::time_point now) -> std::size_t {
        auto lock = std::lock_guard{mutex_};
        return std::erase_if(windows_, [&](const auto& entry) {
            return now > entry.second.reset_at;
        });
    }

    /// Number of keys currently tracked.
    auto size() const -> std::size_t {
        auto lock = std::lock_guard{mutex_};
        return windows_.size();
    }

private:
    struct Window {
        std::size_t count{0};
        Clock::time_point reset_at{};
    };

    std::size_t limit_;
    Clock::duration window_;
    mutable std::mutex mutex_;
    std::map<std::string, Window> windows_;
};

}  // namespace scenesync
