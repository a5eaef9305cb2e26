#include <scenesync/codec.hpp>

#include "storage/chunk.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace scenesync;

namespace {

auto sample_ops() -> std::vector<Op> {
    std::uint8_t raw[16] = {0x50, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9};
    auto s = SessionId{raw};
    return {
        Op{.stamp = {1, s}, .seq = 1, .type = OpType::insert_node, .node = "a",
           .parent = root_node, .order_key = "V", .kind = NodeKind::text},
        Op{.stamp = {2, s}, .seq = 2, .type = OpType::set_field, .node = "a",
           .field = "style.opacity", .value = 0.25},
        Op{.stamp = {3, s}, .seq = 3, .type = OpType::set_field, .node = "a",
           .field = "offset", .value = std::int64_t{-70000}},
        Op{.stamp = {4, s}, .seq = 4, .type = OpType::set_meta, .field = "seo.title",
           .value = std::string{"Caf\xc3\xa9"}, .scope = MetaScope::settings},
        Op{.stamp = {5, s}, .seq = 5, .type = OpType::move_node, .node = "a",
           .parent = root_node, .order_key = "a0V"},
        Op{.stamp = {6, s}, .seq = 6, .type = OpType::delete_node, .node = "a"},
        Op{.stamp = {7, s}, .seq = 7, .type = OpType::set_field, .node = "a",
           .field = "hidden", .value = true},
        Op{.stamp = {8, s}, .seq = 8, .type = OpType::set_field, .node = "a",
           .field = "cleared", .value = Null{}},
    };
}

}  // namespace

// -- Log segments -------------------------------------------------------------

TEST(Codec, encode_decode_preserves_every_op_kind) {
    auto ops = sample_ops();
    auto decoded = decode_ops(encode_ops(ops));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, ops);
}

TEST(Codec, empty_batch) {
    auto decoded = decode_ops(encode_ops({}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(Codec, large_batches_are_compressed) {
    auto ops = std::vector<Op>{};
    for (int i = 0; i < 500; ++i) {
        auto op = sample_ops()[1];
        op.seq = static_cast<std::uint64_t>(i + 1);
        op.value = std::string(40, 'x');
        ops.push_back(op);
    }
    auto bytes = encode_ops(ops);
    EXPECT_EQ(static_cast<std::uint8_t>(bytes[6]) & storage::flag_compressed,
              storage::flag_compressed);
    auto decoded = decode_ops(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->size(), 500u);
    EXPECT_EQ(decoded->back(), ops.back());
}

TEST(Codec, flipped_byte_is_detected) {
    auto bytes = encode_ops(sample_ops());
    for (auto pos : {std::size_t{0}, std::size_t{5}, bytes.size() / 2, bytes.size() - 1}) {
        auto copy = bytes;
        copy[pos] ^= std::byte{0x40};
        EXPECT_FALSE(decode_ops(copy).has_value()) << "offset " << pos;
    }
}

TEST(Codec, truncation_is_detected) {
    auto bytes = encode_ops(sample_ops());
    for (std::size_t len = 0; len < bytes.size(); len += 7) {
        auto prefix = std::span<const std::byte>{bytes.data(), len};
        EXPECT_FALSE(decode_ops(prefix).has_value()) << "length " << len;
    }
}

TEST(Codec, trailing_bytes_are_rejected) {
    auto bytes = encode_ops(sample_ops());
    bytes.push_back(std::byte{0});
    EXPECT_FALSE(decode_ops(bytes).has_value());
}

// -- Chunk envelope -----------------------------------------------------------

TEST(Chunk, header_starts_with_magic_and_type) {
    auto body = std::vector<std::byte>{std::byte{1}, std::byte{2}, std::byte{3}};
    auto chunk = storage::write_chunk(storage::ChunkType::snapshot, body);
    EXPECT_EQ(chunk[0], std::byte{0x53});
    EXPECT_EQ(chunk[3], std::byte{0x4E});
    EXPECT_EQ(static_cast<std::uint8_t>(chunk[4]), storage::chunk_version);
    EXPECT_EQ(static_cast<std::uint8_t>(chunk[5]),
              static_cast<std::uint8_t>(storage::ChunkType::snapshot));

    auto read = storage::read_chunk(storage::ChunkType::snapshot, chunk);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, body);
}

TEST(Chunk, wrong_type_is_rejected) {
    auto chunk = storage::write_chunk(storage::ChunkType::snapshot, {});
    EXPECT_FALSE(storage::read_chunk(storage::ChunkType::log_segment, chunk).has_value());
}

TEST(Chunk, incompressible_bodies_are_stored_raw) {
    auto body = std::vector<std::byte>{};
    auto x = std::uint32_t{2463534242u};
    for (int i = 0; i < 2048; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        body.push_back(static_cast<std::byte>(x & 0xff));
    }
    auto chunk = storage::write_chunk(storage::ChunkType::snapshot, body);
    EXPECT_EQ(static_cast<std::uint8_t>(chunk[6]) & storage::flag_compressed, 0);
    EXPECT_EQ(*storage::read_chunk(storage::ChunkType::snapshot, chunk), body);
}

TEST(Chunk, crc32_matches_known_vector) {
    const auto text = std::string{"123456789"};
    auto bytes = std::vector<std::byte>{};
    for (auto c : text) bytes.push_back(static_cast<std::byte>(c));
    EXPECT_EQ(storage::crc32_of(bytes), 0xCBF43926u);
}
