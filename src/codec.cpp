#include <scenesync/codec.hpp>

#include "storage/byte_reader.hpp"
#include "storage/byte_writer.hpp"
#include "storage/chunk.hpp"

namespace scenesync {

auto encode_ops(std::span<const Op> ops) -> std::vector<std::byte> {
    auto w = storage::ByteWriter{};
    w.write_uleb128(ops.size());
    for (const auto& op : ops) w.write_op(op);
    return storage::write_chunk(storage::ChunkType::log_segment, w.data());
}

auto decode_ops(std::span<const std::byte> data) -> std::optional<std::vector<Op>> {
    auto body = storage::read_chunk(storage::ChunkType::log_segment, data);
    if (!body) return std::nullopt;

    auto r = storage::ByteReader{*body};
    auto count = r.read_uleb128();
    if (!count || *count > r.remaining()) return std::nullopt;

    auto ops = std::vector<Op>{};
    ops.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto op = r.read_op();
        if (!op) return std::nullopt;
        ops.push_back(std::move(*op));
    }
    if (!r.at_end()) return std::nullopt;
    return ops;
}

}  // namespace scenesync
