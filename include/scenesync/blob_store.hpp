/// @file blob_store.hpp
/// @brief Durable key/blob storage for snapshots and log segments.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace scenesync {

/// Write-once blob storage addressed by `/`-separated keys.
///
/// Implementations throw scenesync::Exception with
/// ErrorKind::transient_storage when the medium fails; callers retry.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /// Store a blob under a new key.
    /// @return false (and leave the stored blob untouched) if the key exists.
    virtual auto put(const std::string& key, std::span<const std::byte> data) -> bool = 0;

    /// Read a blob, or nullopt if the key does not exist.
    virtual auto get(const std::string& key) -> std::optional<std::vector<std::byte>> = 0;

    /// All keys starting with `prefix`, in ascending order.
    virtual auto list(const std::string& prefix) -> std::vector<std::string> = 0;

    /// Delete a blob. Removing a missing key is not an error.
    virtual void remove(const std::string& key) = 0;
};

/// Blobs as files under a root directory.
///
/// A blob is written to a temporary file and then linked into place, which
/// fails if the key already exists, so readers never see a partial blob and
/// existing blobs are never overwritten.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path root);

    auto put(const std::string& key, std::span<const std::byte> data) -> bool override;
    auto get(const std::string& key) -> std::optional<std::vector<std::byte>> override;
    auto list(const std::string& prefix) -> std::vector<std::string> override;
    void remove(const std::string& key) override;

    auto root() const -> const std::filesystem::path& { return root_; }

private:
    auto path_of(const std::string& key) const -> std::filesystem::path;

    std::filesystem::path root_;
};

/// In-memory blobs, with failure injection for tests.
class MemoryBlobStore : public BlobStore {
public:
    auto put(const std::string& key, std::span<const std::byte> data) -> bool override;
    auto get(const std::string& key) -> std::optional<std::vector<std::byte>> override;
    auto list(const std::string& prefix) -> std::vector<std::string> override;
    void remove(const std::string& key) override;

    /// Make the next `n` puts throw transient_storage.
    void fail_next_puts(std::size_t n);

    /// Make every operation throw transient_storage until cleared.
    void set_unavailable(bool unavailable);

    /// Flip one byte of a stored blob (simulates on-disk corruption).
    void corrupt(const std::string& key, std::size_t offset);

    /// Number of successful puts.
    auto put_count() const -> std::uint64_t;

private:
    void check_available() const;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::byte>> blobs_;
    std::size_t failing_puts_{0};
    bool unavailable_{false};
    std::uint64_t puts_{0};
};

}  // namespace scenesync
