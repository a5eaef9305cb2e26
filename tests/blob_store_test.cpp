#include <scenesync/blob_store.hpp>
#include <scenesync/error.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace scenesync;
namespace fs = std::filesystem;

namespace {

auto bytes(std::string_view s) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    for (auto c : s) out.push_back(static_cast<std::byte>(c));
    return out;
}

auto temp_root() -> fs::path {
    static auto counter = std::atomic<int>{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return fs::temp_directory_path() /
           ("scenesync_" + std::string{info->name()} + "_" + std::to_string(counter++));
}

}  // namespace

// -- Shared behaviour ---------------------------------------------------------

class BlobStoreContract : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        if (GetParam()) {
            root_ = temp_root();
            fs::remove_all(root_);
            store_ = std::make_unique<FileBlobStore>(root_);
        } else {
            store_ = std::make_unique<MemoryBlobStore>();
        }
    }

    void TearDown() override {
        store_.reset();
        if (!root_.empty()) fs::remove_all(root_);
    }

    fs::path root_;
    std::unique_ptr<BlobStore> store_;
};

TEST_P(BlobStoreContract, put_then_get) {
    EXPECT_TRUE(store_->put("snapshots/doc/1", bytes("hello")));
    EXPECT_EQ(store_->get("snapshots/doc/1"), bytes("hello"));
    EXPECT_FALSE(store_->get("snapshots/doc/2").has_value());
}

TEST_P(BlobStoreContract, existing_keys_are_never_overwritten) {
    EXPECT_TRUE(store_->put("log/doc/1", bytes("first")));
    EXPECT_FALSE(store_->put("log/doc/1", bytes("second")));
    EXPECT_EQ(store_->get("log/doc/1"), bytes("first"));
}

TEST_P(BlobStoreContract, list_filters_by_prefix_in_order) {
    store_->put("log/b/2", bytes("x"));
    store_->put("log/a/2", bytes("x"));
    store_->put("log/a/1", bytes("x"));
    store_->put("snapshots/a/1", bytes("x"));

    EXPECT_EQ(store_->list("log/a/"), (std::vector<std::string>{"log/a/1", "log/a/2"}));
    EXPECT_EQ(store_->list("log/").size(), 3u);
    EXPECT_TRUE(store_->list("missing/").empty());
}

TEST_P(BlobStoreContract, remove_is_idempotent) {
    store_->put("k/1", bytes("x"));
    store_->remove("k/1");
    EXPECT_NO_THROW(store_->remove("k/1"));
    EXPECT_FALSE(store_->get("k/1").has_value());
    EXPECT_TRUE(store_->put("k/1", bytes("again")));
}

TEST_P(BlobStoreContract, empty_blob) {
    EXPECT_TRUE(store_->put("empty", {}));
    auto blob = store_->get("empty");
    ASSERT_TRUE(blob.has_value());
    EXPECT_TRUE(blob->empty());
}

INSTANTIATE_TEST_SUITE_P(Stores, BlobStoreContract, ::testing::Values(false, true),
                         [](const auto& info) { return info.param ? "file" : "memory"; });

// -- FileBlobStore ------------------------------------------------------------

TEST(FileBlobStore, rejects_keys_escaping_the_root) {
    auto root = temp_root();
    auto store = FileBlobStore{root};
    EXPECT_THROW(store.put("../outside", bytes("x")), Exception);
    EXPECT_THROW(store.put("/abs", bytes("x")), Exception);
    EXPECT_THROW(store.get("a/./b"), Exception);
    fs::remove_all(root);
}

TEST(FileBlobStore, blobs_survive_reopening) {
    auto root = temp_root();
    {
        auto store = FileBlobStore{root};
        store.put("snapshots/site/0001-a", bytes("state"));
    }
    auto reopened = FileBlobStore{root};
    EXPECT_EQ(reopened.get("snapshots/site/0001-a"), bytes("state"));
    EXPECT_EQ(reopened.list("snapshots/"), std::vector<std::string>{"snapshots/site/0001-a"});
    fs::remove_all(root);
}

TEST(FileBlobStore, concurrent_writers_of_one_key_have_a_single_winner) {
    auto root = temp_root();
    auto store = FileBlobStore{root};
    auto wins = std::atomic<int>{0};
    auto threads = std::vector<std::thread>{};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            if (store.put("race/key", bytes("writer" + std::to_string(i)))) ++wins;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(store.list("race/").size(), 1u);
    fs::remove_all(root);
}

// -- MemoryBlobStore fault injection ------------------------------------------

TEST(MemoryBlobStore, failing_puts_throw_transient_storage) {
    auto store = MemoryBlobStore{};
    store.fail_next_puts(2);
    for (int i = 0; i < 2; ++i) {
        try {
            store.put("k", bytes("x"));
            ADD_FAILURE() << "put should fail";
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::transient_storage);
        }
    }
    EXPECT_TRUE(store.put("k", bytes("x")));
    EXPECT_EQ(store.put_count(), 1u);
}

TEST(MemoryBlobStore, unavailable_store_fails_everything) {
    auto store = MemoryBlobStore{};
    store.put("k", bytes("x"));
    store.set_unavailable(true);
    EXPECT_THROW(store.get("k"), Exception);
    EXPECT_THROW(store.list(""), Exception);
    EXPECT_THROW(store.remove("k"), Exception);
    store.set_unavailable(false);
    EXPECT_EQ(store.get("k"), bytes("x"));
}

TEST(MemoryBlobStore, corrupt_flips_a_byte) {
    auto store = MemoryBlobStore{};
    store.put("k", bytes("abc"));
    store.corrupt("k", 1);
    auto blob = store.get("k");
    EXPECT_NE(blob, bytes("abc"));
    EXPECT_EQ((*blob)[0], std::byte{'a'});
}
