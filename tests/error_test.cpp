#include <scenesync/error.hpp>

#include <gtest/gtest.h>

using namespace scenesync;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::auth_rejected),       "auth_rejected");
    EXPECT_EQ(to_string_view(ErrorKind::validation_rejected), "validation_rejected");
    EXPECT_EQ(to_string_view(ErrorKind::transient_storage),   "transient_storage");
    EXPECT_EQ(to_string_view(ErrorKind::fanout_unavailable),  "fanout_unavailable");
    EXPECT_EQ(to_string_view(ErrorKind::corrupt_snapshot),    "corrupt_snapshot");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_frame),       "invalid_frame");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error),      "decoding_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::transient_storage, "disk full"};
    const auto e2 = Error{ErrorKind::transient_storage, "disk full"};
    const auto e3 = Error{ErrorKind::corrupt_snapshot, "disk full"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Exception, carries_kind_and_message) {
    try {
        throw Exception{ErrorKind::validation_rejected, "cycle"};
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::validation_rejected);
        EXPECT_STREQ(e.what(), "cycle");
        EXPECT_EQ(e.error().message, "cycle");
    }
}

TEST(Exception, is_a_runtime_error) {
    EXPECT_THROW(throw Exception(ErrorKind::fanout_unavailable, "down"), std::runtime_error);
}
