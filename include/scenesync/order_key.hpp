/// @file order_key.hpp
/// @brief Fractional order keys for sibling positions.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenesync {

/// Order keys are base-62 fractions written with the digits `0-9A-Za-z`,
/// whose ASCII order matches digit order, so keys compare as plain strings.
/// A valid key is non-empty and does not end in `0`, which guarantees there
/// is always room for a key below it.
inline constexpr auto order_key_digits =
    std::string_view{"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"};

/// Whether `key` is a well-formed order key.
auto is_valid_order_key(std::string_view key) -> bool;

/// A key strictly between `lo` and `hi`.
///
/// A missing bound means "before everything" (lo) or "after everything" (hi).
/// Only the position of the new key is chosen; no existing key changes.
/// @throws std::invalid_argument if a bound is invalid or `lo >= hi`.
auto key_between(const std::optional<std::string>& lo,
                 const std::optional<std::string>& hi) -> std::string;

/// `n` ascending keys strictly between `lo` and `hi`, spread evenly.
auto keys_between(const std::optional<std::string>& lo,
                  const std::optional<std::string>& hi,
                  std::size_t n) -> std::vector<std::string>;

}  // namespace scenesync
