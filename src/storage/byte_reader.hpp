#pragma once

// Byte stream reader for the snapshot and log segment formats.
// Every read returns nullopt on truncated or invalid input.
// Internal header, not installed.

#include "byte_writer.hpp"

#include <scenesync/op.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>

namespace scenesync::storage {

class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data)
        : data_{data} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto value = std::uint64_t{0};
        for (auto shift = 0u; shift < 64; shift += 7) {
            auto b = read_u8();
            if (!b) return std::nullopt;
            value |= static_cast<std::uint64_t>(*b & 0x7F) << shift;
            if ((*b & 0x80) == 0) return value;
        }
        return std::nullopt;  // overlong
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto zigzag = read_uleb128();
        if (!zigzag) return std::nullopt;
        return static_cast<std::int64_t>((*zigzag >> 1) ^ (~(*zigzag & 1) + 1));
    }

    auto read_u32_le() -> std::optional<std::uint32_t> {
        auto bytes = read_bytes(4);
        if (!bytes) return std::nullopt;
        auto v = std::uint32_t{0};
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>((*bytes)[i]) << (i * 8);
        }
        return v;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_session() -> std::optional<SessionId> {
        auto bytes = read_bytes(SessionId::size);
        if (!bytes) return std::nullopt;
        auto id = SessionId{};
        std::memcpy(id.bytes.data(), bytes->data(), SessionId::size);
        return id;
    }

    auto read_stamp() -> std::optional<Stamp> {
        auto counter = read_uleb128();
        if (!counter) return std::nullopt;
        auto session = read_session();
        if (!session) return std::nullopt;
        return Stamp{*counter, *session};
    }

    auto read_scalar() -> std::optional<ScalarValue> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        switch (static_cast<ScalarTag>(*tag)) {
            case ScalarTag::null_value:
                return ScalarValue{Null{}};
            case ScalarTag::boolean: {
                auto b = read_u8();
                if (!b) return std::nullopt;
                return ScalarValue{*b != 0};
            }
            case ScalarTag::integer: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return ScalarValue{*v};
            }
            case ScalarTag::real: {
                auto lo = read_u32_le();
                auto hi = read_u32_le();
                if (!lo || !hi) return std::nullopt;
                auto bits = (static_cast<std::uint64_t>(*hi) << 32) | *lo;
                return ScalarValue{std::bit_cast<double>(bits)};
            }
            case ScalarTag::string: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return ScalarValue{std::move(*s)};
            }
        }
        return std::nullopt;
    }

    auto read_op() -> std::optional<Op> {
        auto op = Op{};
        auto stamp = read_stamp();
        auto seq = stamp ? read_uleb128() : std::nullopt;
        auto type = seq ? read_u8() : std::nullopt;
        if (!type || *type > static_cast<std::uint8_t>(OpType::set_meta)) return std::nullopt;
        op.stamp = *stamp;
        op.seq = *seq;
        op.type = static_cast<OpType>(*type);

        auto node = read_string();
        if (!node) return std::nullopt;
        op.node = std::move(*node);

        switch (op.type) {
            case OpType::insert_node:
            case OpType::move_node: {
                auto parent = read_string();
                auto key = parent ? read_string() : std::nullopt;
                if (!key) return std::nullopt;
                op.parent = std::move(*parent);
                op.order_key = std::move(*key);
                if (op.type == OpType::insert_node) {
                    auto kind = read_u8();
                    if (!kind || *kind > static_cast<std::uint8_t>(NodeKind::component)) {
                        return std::nullopt;
                    }
                    op.kind = static_cast<NodeKind>(*kind);
                }
                break;
            }
            case OpType::set_meta: {
                auto scope = read_u8();
                if (!scope || *scope > static_cast<std::uint8_t>(MetaScope::assets)) {
                    return std::nullopt;
                }
                op.scope = static_cast<MetaScope>(*scope);
                [[fallthrough]];
            }
            case OpType::set_field: {
                auto field = read_string();
                auto value = field ? read_scalar() : std::nullopt;
                if (!value) return std::nullopt;
                op.field = std::move(*field);
                op.value = std::move(*value);
                break;
            }
            case OpType::delete_node:
                break;
        }
        return op;
    }

    auto read_watermark() -> std::optional<Watermark> {
        auto count = read_uleb128();
        if (!count) return std::nullopt;
        auto wm = Watermark{};
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto session = read_session();
            auto seq = session ? read_uleb128() : std::nullopt;
            if (!seq) return std::nullopt;
            wm.advance(*session, *seq);
        }
        return wm;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_{0};
};

}  // namespace scenesync::storage
