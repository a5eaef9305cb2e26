#include <scenesync/order_key.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace scenesync;

TEST(OrderKey, validity) {
    EXPECT_TRUE(is_valid_order_key("V"));
    EXPECT_TRUE(is_valid_order_key("a0z"));
    EXPECT_FALSE(is_valid_order_key(""));
    EXPECT_FALSE(is_valid_order_key("V0"));
    EXPECT_FALSE(is_valid_order_key("a-b"));
}

TEST(OrderKey, between_nothing_is_the_middle_digit) {
    auto key = key_between(std::nullopt, std::nullopt);
    EXPECT_TRUE(is_valid_order_key(key));
    EXPECT_EQ(key, "V");
}

TEST(OrderKey, result_is_strictly_between_bounds) {
    const auto cases = std::vector<std::pair<std::string, std::string>>{
        {"1", "2"}, {"A", "B"}, {"V", "W"}, {"a", "a1"}, {"az", "b"}, {"1", "11"}, {"y", "z"},
    };
    for (const auto& [lo, hi] : cases) {
        auto key = key_between(lo, hi);
        EXPECT_TRUE(is_valid_order_key(key)) << lo << " " << hi << " -> " << key;
        EXPECT_LT(lo, key) << lo << " " << hi;
        EXPECT_LT(key, hi) << lo << " " << hi;
    }
}

TEST(OrderKey, open_bounds) {
    auto before = key_between(std::nullopt, std::string{"1"});
    EXPECT_LT(before, "1");
    EXPECT_TRUE(is_valid_order_key(before));

    auto after = key_between(std::string{"z"}, std::nullopt);
    EXPECT_GT(after, "z");
    EXPECT_TRUE(is_valid_order_key(after));
}

TEST(OrderKey, repeated_insertion_at_the_front_stays_ordered) {
    auto hi = std::optional<std::string>{"V"};
    for (int i = 0; i < 200; ++i) {
        auto key = key_between(std::nullopt, hi);
        ASSERT_TRUE(is_valid_order_key(key));
        ASSERT_LT(key, *hi);
        hi = key;
    }
}

TEST(OrderKey, repeated_insertion_between_neighbours_stays_ordered) {
    auto lo = std::string{"A"};
    auto hi = std::string{"B"};
    for (int i = 0; i < 200; ++i) {
        auto key = key_between(lo, hi);
        ASSERT_LT(lo, key);
        ASSERT_LT(key, hi);
        if (i % 2 == 0) lo = key; else hi = key;
    }
}

TEST(OrderKey, rejects_bad_bounds) {
    EXPECT_THROW(key_between(std::string{"B"}, std::string{"A"}), std::invalid_argument);
    EXPECT_THROW(key_between(std::string{"A"}, std::string{"A"}), std::invalid_argument);
    EXPECT_THROW(key_between(std::string{"A0"}, std::nullopt), std::invalid_argument);
}

TEST(OrderKey, keys_between_are_ascending_and_bounded) {
    auto keys = keys_between(std::string{"1"}, std::string{"3"}, 25);
    ASSERT_EQ(keys.size(), 25u);
    EXPECT_TRUE(std::ranges::is_sorted(keys));
    EXPECT_EQ(std::ranges::adjacent_find(keys), keys.end());
    EXPECT_GT(keys.front(), "1");
    EXPECT_LT(keys.back(), "3");
    EXPECT_TRUE(std::ranges::all_of(keys, [](const std::string& k) { return is_valid_order_key(k); }));
}

TEST(OrderKey, keys_between_zero_is_empty) {
    EXPECT_TRUE(keys_between(std::nullopt, std::nullopt, 0).empty());
}
