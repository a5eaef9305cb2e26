#pragma once

// Chunk envelope for snapshots and log segments.
//
//   magic        (4 bytes: 0x53 0x53 0x59 0x4E, "SSYN")
//   version      (1 byte)
//   chunk_type   (1 byte)
//   flags        (1 byte, bit 0 = body is zlib-compressed)
//   raw_length   (ULEB128, body length before compression)
//   body_length  (ULEB128, stored body length)
//   checksum     (4 bytes little-endian CRC-32 of the stored body)
//   body         (body_length bytes)
//
// Internal header, not installed.

#include "byte_reader.hpp"
#include "byte_writer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace scenesync::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{0x53}, std::byte{0x53}, std::byte{0x59}, std::byte{0x4E}
};

inline constexpr std::uint8_t chunk_version = 1;

// Bodies smaller than this are stored uncompressed.
inline constexpr std::size_t compress_threshold = 512;

// Upper bound on a decompressed body, to refuse memory bombs.
inline constexpr std::uint64_t max_raw_length = std::uint64_t{256} * 1024 * 1024;

enum class ChunkType : std::uint8_t {
    snapshot    = 0x01,
    log_segment = 0x02,
};

inline constexpr std::uint8_t flag_compressed = 0x01;

inline auto crc32_of(std::span<const std::byte> data) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

// zlib-wrapped deflate of a whole buffer.
inline auto zlib_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto bound = ::compressBound(static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);
    auto out_len = static_cast<uLongf>(bound);
    auto ret = ::compress2(reinterpret_cast<Bytef*>(output.data()), &out_len,
                           reinterpret_cast<const Bytef*>(input.data()),
                           static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (ret != Z_OK) return std::nullopt;
    output.resize(out_len);
    return output;
}

// Inflate a buffer whose decompressed size is known exactly.
inline auto zlib_decompress(std::span<const std::byte> input, std::uint64_t raw_length)
    -> std::optional<std::vector<std::byte>> {
    if (raw_length > max_raw_length) return std::nullopt;
    auto output = std::vector<std::byte>(static_cast<std::size_t>(raw_length));
    auto out_len = static_cast<uLongf>(raw_length);
    auto ret = ::uncompress(reinterpret_cast<Bytef*>(output.data()), &out_len,
                            reinterpret_cast<const Bytef*>(input.data()),
                            static_cast<uLong>(input.size()));
    if (ret != Z_OK || out_len != raw_length) return std::nullopt;
    return output;
}

// Write a complete chunk. Large bodies are compressed when that saves space.
inline auto write_chunk(ChunkType type, std::span<const std::byte> body)
    -> std::vector<std::byte> {
    auto flags = std::uint8_t{0};
    auto stored = std::vector<std::byte>{};
    if (body.size() >= compress_threshold) {
        if (auto packed = zlib_compress(body); packed && packed->size() < body.size()) {
            stored = std::move(*packed);
            flags |= flag_compressed;
        }
    }
    if ((flags & flag_compressed) == 0) stored.assign(body.begin(), body.end());

    auto w = ByteWriter{};
    w.write_bytes(chunk_magic);
    w.write_u8(chunk_version);
    w.write_u8(static_cast<std::uint8_t>(type));
    w.write_u8(flags);
    w.write_uleb128(body.size());
    w.write_uleb128(stored.size());
    w.write_u32_le(crc32_of(stored));
    w.write_bytes(stored);
    return w.take();
}

// Parse and verify a chunk, returning its decompressed body.
// Returns nullopt on bad magic, wrong type, checksum mismatch or truncation.
inline auto read_chunk(ChunkType expected, std::span<const std::byte> data)
    -> std::optional<std::vector<std::byte>> {
    auto r = ByteReader{data};
    auto magic = r.read_bytes(chunk_magic.size());
    if (!magic || std::memcmp(magic->data(), chunk_magic.data(), chunk_magic.size()) != 0) {
        return std::nullopt;
    }
    auto version = r.read_u8();
    if (!version || *version != chunk_version) return std::nullopt;
    auto type = r.read_u8();
    if (!type || *type != static_cast<std::uint8_t>(expected)) return std::nullopt;
    auto flags = r.read_u8();
    auto raw_length = flags ? r.read_uleb128() : std::nullopt;
    auto body_length = raw_length ? r.read_uleb128() : std::nullopt;
    auto checksum = body_length ? r.read_u32_le() : std::nullopt;
    if (!checksum || *body_length != r.remaining()) return std::nullopt;

    auto stored = r.read_bytes(static_cast<std::size_t>(*body_length));
    if (!stored || crc32_of(*stored) != *checksum) return std::nullopt;

    if ((*flags & flag_compressed) != 0) {
        return zlib_decompress(*stored, *raw_length);
    }
    if (*raw_length != stored->size()) return std::nullopt;
    return std::vector<std::byte>(stored->begin(), stored->end());
}

}  // namespace scenesync::storage
