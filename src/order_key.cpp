#include <scenesync/order_key.hpp>

#include <iterator>
#include <stdexcept>

namespace scenesync {

namespace {

constexpr auto base = static_cast<int>(order_key_digits.size());

auto digit_value(char c) -> int {
    auto pos = order_key_digits.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

auto digit_char(int v) -> char {
    return order_key_digits[static_cast<std::size_t>(v)];
}

// Midpoint of two fractions `a < b`, where an absent `b` stands for 1.
// Neither argument may end in the zero digit.
auto midpoint(std::string_view a, std::optional<std::string_view> b) -> std::string {
    if (b) {
        // Skip the common prefix, treating a missing digit of `a` as zero.
        auto n = std::size_t{0};
        while (n < b->size() && (n < a.size() ? a[n] : '0') == (*b)[n]) ++n;
        if (n > 0) {
            auto rest_a = n < a.size() ? a.substr(n) : std::string_view{};
            return std::string{b->substr(0, n)} + midpoint(rest_a, b->substr(n));
        }
    }

    auto da = a.empty() ? 0 : digit_value(a.front());
    auto db = b ? digit_value(b->front()) : base;
    if (db - da > 1) return std::string(1, digit_char((da + db) / 2));

    // Adjacent leading digits.
    if (b && b->size() > 1) return std::string{b->substr(0, 1)};
    auto rest_a = a.empty() ? std::string_view{} : a.substr(1);
    return std::string(1, digit_char(da)) + midpoint(rest_a, std::nullopt);
}

}  // namespace

auto is_valid_order_key(std::string_view key) -> bool {
    if (key.empty() || key.back() == order_key_digits.front()) return false;
    for (auto c : key) {
        if (digit_value(c) < 0) return false;
    }
    return true;
}

auto key_between(const std::optional<std::string>& lo,
                 const std::optional<std::string>& hi) -> std::string {
    if (lo && !is_valid_order_key(*lo)) {
        throw std::invalid_argument{"invalid lower order key: " + *lo};
    }
    if (hi && !is_valid_order_key(*hi)) {
        throw std::invalid_argument{"invalid upper order key: " + *hi};
    }
    if (lo && hi && *lo >= *hi) {
        throw std::invalid_argument{"order key bounds out of order: " + *lo + " >= " + *hi};
    }
    auto upper = hi ? std::optional<std::string_view>{*hi} : std::nullopt;
    return midpoint(lo ? std::string_view{*lo} : std::string_view{}, upper);
}

auto keys_between(const std::optional<std::string>& lo,
                  const std::optional<std::string>& hi,
                  std::size_t n) -> std::vector<std::string> {
    if (n == 0) return {};
    auto mid = key_between(lo, hi);
    auto left = keys_between(lo, mid, n / 2);
    auto right = keys_between(mid, hi, n - n / 2 - 1);

    auto result = std::move(left);
    result.push_back(std::move(mid));
    result.insert(result.end(), std::make_move_iterator(right.begin()),
                  std::make_move_iterator(right.end()));
    return result;
}

}  // namespace scenesync
