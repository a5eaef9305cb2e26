#include <scenesync/op.hpp>
#include <scenesync/types.hpp>
#include <scenesync/value.hpp>
#include <scenesync/watermark.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace scenesync;

// -- SessionId ----------------------------------------------------------------

TEST(SessionId, default_constructed_is_all_zeros) {
    const auto id = SessionId{};
    EXPECT_TRUE(id.is_zero());
}

TEST(SessionId, constructed_from_raw_bytes) {
    const std::uint8_t raw[16] = {1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16};
    const auto id = SessionId{raw};

    EXPECT_FALSE(id.is_zero());
    EXPECT_EQ(id.bytes[0], std::byte{1});
    EXPECT_EQ(id.bytes[15], std::byte{16});
}

TEST(SessionId, ordering_is_lexicographic_on_bytes) {
    const std::uint8_t low[16]  = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,1};
    const std::uint8_t high[16] = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,2};
    const auto a = SessionId{low};
    const auto b = SessionId{high};

    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
}

TEST(SessionId, hex_round_trip) {
    const std::uint8_t raw[16] = {0xde,0xad,0xbe,0xef,0,1,2,3,4,5,6,7,8,9,0xa,0xff};
    const auto id = SessionId{raw};

    EXPECT_EQ(id.to_hex(), "deadbeef000102030405060708090aff");
    auto parsed = SessionId::from_hex(id.to_hex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(SessionId, from_hex_rejects_bad_input) {
    EXPECT_FALSE(SessionId::from_hex("").has_value());
    EXPECT_FALSE(SessionId::from_hex("abc").has_value());
    EXPECT_FALSE(SessionId::from_hex("zz000000000000000000000000000000").has_value());
}

TEST(SessionId, from_hex_accepts_uppercase) {
    auto parsed = SessionId::from_hex("DEADBEEF000102030405060708090AFF");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->to_hex(), "deadbeef000102030405060708090aff");
}

TEST(SessionId, random_is_never_zero_and_differs) {
    const auto a = SessionId::random();
    const auto b = SessionId::random();
    EXPECT_FALSE(a.is_zero());
    EXPECT_NE(a, b);
}

TEST(SessionId, hashable_and_usable_in_unordered_set) {
    const std::uint8_t r1[16] = {1,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const std::uint8_t r2[16] = {2,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};

    auto set = std::unordered_set<SessionId>{};
    set.insert(SessionId{r1});
    set.insert(SessionId{r2});
    set.insert(SessionId{r1});  // duplicate

    EXPECT_EQ(set.size(), 2u);
}

// -- Stamp --------------------------------------------------------------------

TEST(Stamp, counter_dominates_ordering) {
    const std::uint8_t r1[16] = {9,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const std::uint8_t r2[16] = {1,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const auto a = Stamp{1, SessionId{r1}};
    const auto b = Stamp{2, SessionId{r2}};

    EXPECT_LT(a, b);
}

TEST(Stamp, equal_counters_break_ties_by_session) {
    const std::uint8_t r1[16] = {1,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const std::uint8_t r2[16] = {2,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const auto a = Stamp{5, SessionId{r1}};
    const auto b = Stamp{5, SessionId{r2}};

    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
}

TEST(Stamp, sortable) {
    const std::uint8_t r[16] = {1,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    auto stamps = std::vector{Stamp{3, SessionId{r}}, Stamp{1, SessionId{r}}, Stamp{2, SessionId{r}}};
    std::ranges::sort(stamps);

    EXPECT_EQ(stamps[0].counter, 1u);
    EXPECT_EQ(stamps[2].counter, 3u);
}

// -- RoomId -------------------------------------------------------------------

TEST(RoomId, made_from_site_and_version) {
    EXPECT_EQ(make_room_id("site_42", "3"), "site_42:3");
}

// -- Watermark ----------------------------------------------------------------

TEST(Watermark, starts_empty) {
    const auto w = Watermark{};
    EXPECT_TRUE(w.empty());
    EXPECT_EQ(w.total(), 0u);
    EXPECT_EQ(w.get(SessionId::random()), 0u);
}

TEST(Watermark, advance_only_moves_forward) {
    const auto s = SessionId::random();
    auto w = Watermark{};
    w.advance(s, 5);
    w.advance(s, 3);

    EXPECT_EQ(w.get(s), 5u);
    EXPECT_TRUE(w.covers(s, 5));
    EXPECT_FALSE(w.covers(s, 6));
}

TEST(Watermark, dominates_and_meet) {
    const std::uint8_t r1[16] = {1,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const std::uint8_t r2[16] = {2,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0};
    const auto a = SessionId{r1};
    const auto b = SessionId{r2};

    auto x = Watermark{};
    x.advance(a, 4);
    x.advance(b, 1);
    auto y = Watermark{};
    y.advance(a, 2);

    EXPECT_TRUE(x.dominates(y));
    EXPECT_FALSE(y.dominates(x));

    auto m = x.meet(y);
    EXPECT_EQ(m.get(a), 2u);
    EXPECT_EQ(m.get(b), 0u);
    EXPECT_EQ(m.entries().size(), 1u);
    EXPECT_EQ(x.total(), 5u);
}

// -- Enumerations -------------------------------------------------------------

TEST(NodeKind, string_round_trip) {
    for (auto kind : {NodeKind::canvas, NodeKind::text, NodeKind::image,
                      NodeKind::group, NodeKind::component}) {
        EXPECT_EQ(parse_node_kind(to_string_view(kind)), kind);
    }
    EXPECT_FALSE(parse_node_kind("video").has_value());
}

TEST(MetaScope, string_round_trip) {
    for (auto scope : {MetaScope::canvas, MetaScope::theme, MetaScope::settings, MetaScope::assets}) {
        EXPECT_EQ(parse_meta_scope(to_string_view(scope)), scope);
    }
    EXPECT_FALSE(parse_meta_scope("layout").has_value());
}

TEST(OpType, string_round_trip) {
    for (auto type : {OpType::insert_node, OpType::delete_node, OpType::set_field,
                      OpType::move_node, OpType::set_meta}) {
        EXPECT_EQ(parse_op_type(to_string_view(type)), type);
    }
    EXPECT_FALSE(parse_op_type("rename").has_value());
}

TEST(ScalarValue, get_scalar_matches_alternative) {
    const auto v = ScalarValue{std::string{"hello"}};
    EXPECT_EQ(get_scalar<std::string>(v), "hello");
    EXPECT_FALSE(get_scalar<std::int64_t>(v).has_value());
    EXPECT_FALSE(get_scalar<bool>(std::optional<ScalarValue>{}).has_value());
}
