#pragma once

// Byte stream writer for the snapshot and log segment formats.
// Internal header, not installed.

#include <scenesync/op.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace scenesync::storage {

// Scalar value tags on disk. Never renumber.
enum class ScalarTag : std::uint8_t {
    null_value = 0,
    boolean    = 1,
    integer    = 2,
    real       = 3,
    string     = 4,
};

class ByteWriter {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // Unsigned LEB128: seven bits per byte, high bit set while more follow.
    void write_uleb128(std::uint64_t value) {
        while (value >= 0x80) {
            data_.push_back(static_cast<std::byte>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        data_.push_back(static_cast<std::byte>(value));
    }

    // Signed values are zigzag-mapped onto the unsigned encoding.
    void write_sleb128(std::int64_t value) {
        auto zigzag = (static_cast<std::uint64_t>(value) << 1) ^
                      static_cast<std::uint64_t>(value >> 63);
        write_uleb128(zigzag);
    }

    void write_u32_le(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            data_.push_back(static_cast<std::byte>((v >> (i * 8)) & 0xFF));
        }
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) data_.push_back(static_cast<std::byte>(c));
    }

    void write_session(const SessionId& id) {
        write_bytes(id.bytes);
    }

    void write_stamp(const Stamp& stamp) {
        write_uleb128(stamp.counter);
        write_session(stamp.session);
    }

    void write_scalar(const ScalarValue& sv) {
        std::visit([this](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                write_tag(ScalarTag::null_value);
            } else if constexpr (std::is_same_v<T, bool>) {
                write_tag(ScalarTag::boolean);
                write_u8(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                write_tag(ScalarTag::integer);
                write_sleb128(v);
            } else if constexpr (std::is_same_v<T, double>) {
                write_tag(ScalarTag::real);
                auto bits = std::bit_cast<std::uint64_t>(v);
                write_u32_le(static_cast<std::uint32_t>(bits));
                write_u32_le(static_cast<std::uint32_t>(bits >> 32));
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_tag(ScalarTag::string);
                write_string(v);
            }
        }, sv);
    }

    void write_op(const Op& op) {
        write_stamp(op.stamp);
        write_uleb128(op.seq);
        write_u8(static_cast<std::uint8_t>(op.type));
        write_string(op.node);
        switch (op.type) {
            case OpType::insert_node:
                write_string(op.parent);
                write_string(op.order_key);
                write_u8(static_cast<std::uint8_t>(op.kind));
                break;
            case OpType::move_node:
                write_string(op.parent);
                write_string(op.order_key);
                break;
            case OpType::set_field:
                write_string(op.field);
                write_scalar(op.value);
                break;
            case OpType::set_meta:
                write_u8(static_cast<std::uint8_t>(op.scope));
                write_string(op.field);
                write_scalar(op.value);
                break;
            case OpType::delete_node:
                break;
        }
    }

    void write_watermark(const Watermark& wm) {
        write_uleb128(wm.entries().size());
        for (const auto& [session, seq] : wm.entries()) {
            write_session(session);
            write_uleb128(seq);
        }
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    void write_tag(ScalarTag tag) { write_u8(static_cast<std::uint8_t>(tag)); }

    std::vector<std::byte> data_;
};

}  // namespace scenesync::storage
