/// @file codec.hpp
/// @brief Binary encoding of operation batches (log segments).

#pragma once

#include <scenesync/op.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace scenesync {

/// Encode a batch of ops as a checksummed log segment.
auto encode_ops(std::span<const Op> ops) -> std::vector<std::byte>;

/// Decode a log segment produced by encode_ops().
/// @return The ops, or nullopt if the segment is truncated or fails its checksum.
auto decode_ops(std::span<const std::byte> data) -> std::optional<std::vector<Op>>;

}  // namespace scenesync
