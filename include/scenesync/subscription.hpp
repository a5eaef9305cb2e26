/// @file subscription.hpp
/// @brief RAII handle for a registered callback.

#pragma once

#include <functional>
#include <utility>

namespace scenesync {

/// Keeps a callback registered for as long as it is alive.
///
/// Destroying or reset()ing the handle unregisters the callback. Handles are
/// move-only; a default-constructed handle owns nothing.
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> cancel)
        : cancel_{std::move(cancel)} {}

    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : cancel_{std::exchange(other.cancel_, nullptr)} {}

    auto operator=(Subscription&& other) noexcept -> Subscription& {
        if (this != &other) {
            reset();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    auto operator=(const Subscription&) -> Subscription& = delete;

    /// Unregister now.
    void reset() {
        if (auto cancel = std::exchange(cancel_, nullptr)) cancel();
    }

    explicit operator bool() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

}  // namespace scenesync
