#include <scenesync/blob_store.hpp>

#include <scenesync/error.hpp>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace scenesync {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void storage_failure(const std::string& what, const std::error_code& ec = {}) {
    auto message = what;
    if (ec) message += ": " + ec.message();
    throw Exception{ErrorKind::transient_storage, std::move(message)};
}

auto valid_key(const std::string& key) -> bool {
    if (key.empty() || key.front() == '/') return false;
    for (const auto& part : fs::path{key}) {
        if (part == ".." || part == ".") return false;
    }
    return true;
}

}  // namespace

// -- FileBlobStore ------------------------------------------------------------

FileBlobStore::FileBlobStore(fs::path root)
    : root_{std::move(root)} {
    auto ec = std::error_code{};
    fs::create_directories(root_, ec);
    if (ec) storage_failure("cannot create storage root " + root_.string(), ec);
}

auto FileBlobStore::path_of(const std::string& key) const -> fs::path {
    if (!valid_key(key)) {
        throw Exception{ErrorKind::validation_rejected, "invalid blob key: " + key};
    }
    return root_ / key;
}

auto FileBlobStore::put(const std::string& key, std::span<const std::byte> data) -> bool {
    static auto temp_counter = std::atomic<std::uint64_t>{0};

    auto target = path_of(key);
    auto ec = std::error_code{};
    if (fs::exists(target, ec)) return false;
    fs::create_directories(target.parent_path(), ec);
    if (ec) storage_failure("cannot create directory for " + key, ec);

    auto temp = target;
    temp += ".tmp-" + std::to_string(temp_counter.fetch_add(1));
    {
        auto out = std::ofstream{temp, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            fs::remove(temp, ec);
            storage_failure("cannot write " + key);
        }
    }

    fs::create_hard_link(temp, target, ec);
    auto link_error = ec;
    fs::remove(temp, ec);
    if (link_error) {
        if (link_error == std::errc::file_exists) return false;
        storage_failure("cannot publish " + key, link_error);
    }
    return true;
}

auto FileBlobStore::get(const std::string& key) -> std::optional<std::vector<std::byte>> {
    auto path = path_of(key);
    auto ec = std::error_code{};
    if (!fs::exists(path, ec)) return std::nullopt;

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) storage_failure("cannot open " + key);
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in}, {}};
    if (in.bad()) storage_failure("cannot read " + key);

    auto data = std::vector<std::byte>(chars.size());
    std::memcpy(data.data(), chars.data(), chars.size());
    return data;
}

auto FileBlobStore::list(const std::string& prefix) -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    auto ec = std::error_code{};
    auto it = fs::recursive_directory_iterator{root_, ec};
    if (ec) storage_failure("cannot list " + root_.string(), ec);
    for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) storage_failure("cannot list " + root_.string(), ec);
        if (!it->is_regular_file()) continue;
        auto key = fs::relative(it->path(), root_).generic_string();
        if (key.find(".tmp-") != std::string::npos) continue;
        if (key.starts_with(prefix)) keys.push_back(std::move(key));
    }
    std::ranges::sort(keys);
    return keys;
}

void FileBlobStore::remove(const std::string& key) {
    auto ec = std::error_code{};
    fs::remove(path_of(key), ec);
    if (ec) storage_failure("cannot remove " + key, ec);
}

// -- MemoryBlobStore ----------------------------------------------------------

void MemoryBlobStore::check_available() const {
    if (unavailable_) storage_failure("memory store is unavailable");
}

auto MemoryBlobStore::put(const std::string& key, std::span<const std::byte> data) -> bool {
    auto lock = std::lock_guard{mutex_};
    check_available();
    if (failing_puts_ > 0) {
        --failing_puts_;
        storage_failure("injected put failure for " + key);
    }
    if (blobs_.contains(key)) return false;
    blobs_.emplace(key, std::vector<std::byte>(data.begin(), data.end()));
    ++puts_;
    return true;
}

auto MemoryBlobStore::get(const std::string& key) -> std::optional<std::vector<std::byte>> {
    auto lock = std::lock_guard{mutex_};
    check_available();
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

auto MemoryBlobStore::list(const std::string& prefix) -> std::vector<std::string> {
    auto lock = std::lock_guard{mutex_};
    check_available();
    auto keys = std::vector<std::string>{};
    for (auto it = blobs_.lower_bound(prefix); it != blobs_.end(); ++it) {
        if (!it->first.starts_with(prefix)) break;
        keys.push_back(it->first);
    }
    return keys;
}

void MemoryBlobStore::remove(const std::string& key) {
    auto lock = std::lock_guard{mutex_};
    check_available();
    blobs_.erase(key);
}

void MemoryBlobStore::fail_next_puts(std::size_t n) {
    auto lock = std::lock_guard{mutex_};
    failing_puts_ = n;
}

void MemoryBlobStore::set_unavailable(bool unavailable) {
    auto lock = std::lock_guard{mutex_};
    unavailable_ = unavailable;
}

void MemoryBlobStore::corrupt(const std::string& key, std::size_t offset) {
    auto lock = std::lock_guard{mutex_};
    auto it = blobs_.find(key);
    if (it == blobs_.end() || it->second.empty()) return;
    auto& byte = it->second[offset % it->second.size()];
    byte = byte ^ std::byte{0xFF};
}

auto MemoryBlobStore::put_count() const -> std::uint64_t {
    auto lock = std::lock_guard{mutex_};
    return puts_;
}

}  // namespace scenesync
