/// @file error.hpp
/// @brief Error types for the scenesync engine.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace scenesync {

/// Categories of errors that can occur in the engine.
enum class ErrorKind : std::uint8_t {
    auth_rejected,        ///< Bad or expired credential, or no access to the document.
    validation_rejected,  ///< A domain edit violates a structural invariant.
    transient_storage,    ///< A snapshot or log write failed; will be retried.
    fanout_unavailable,   ///< The cross-process bus cannot be reached.
    corrupt_snapshot,     ///< A stored snapshot failed its integrity check.
    invalid_frame,        ///< A transport frame is malformed or unexpected.
    decoding_error,       ///< Binary data could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::auth_rejected:       return "auth_rejected";
        case ErrorKind::validation_rejected: return "validation_rejected";
        case ErrorKind::transient_storage:   return "transient_storage";
        case ErrorKind::fanout_unavailable:  return "fanout_unavailable";
        case ErrorKind::corrupt_snapshot:    return "corrupt_snapshot";
        case ErrorKind::invalid_frame:       return "invalid_frame";
        case ErrorKind::decoding_error:      return "decoding_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying a structured Error.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace scenesync
