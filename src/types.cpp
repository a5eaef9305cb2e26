#include <scenesync/types.hpp>

#include <random>

namespace scenesync {

namespace {

constexpr auto hex_digits = std::string_view{"0123456789abcdef"};

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

auto SessionId::to_hex() const -> std::string {
    auto out = std::string{};
    out.reserve(size * 2);
    for (auto b : bytes) {
        auto v = static_cast<unsigned>(b);
        out += hex_digits[v >> 4];
        out += hex_digits[v & 0x0F];
    }
    return out;
}

auto SessionId::from_hex(std::string_view hex) -> std::optional<SessionId> {
    if (hex.size() != size * 2) return std::nullopt;
    auto id = SessionId{};
    for (std::size_t i = 0; i < size; ++i) {
        auto hi = hex_value(hex[2 * i]);
        auto lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes[i] = static_cast<std::byte>((hi << 4) | lo);
    }
    return id;
}

auto SessionId::random() -> SessionId {
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto id = SessionId{};
    do {
        for (std::size_t i = 0; i < size; i += 8) {
            auto word = engine();
            for (std::size_t j = 0; j < 8; ++j) {
                id.bytes[i + j] = static_cast<std::byte>((word >> (j * 8)) & 0xFF);
            }
        }
    } while (id.is_zero());
    return id;
}

}  // namespace scenesync
