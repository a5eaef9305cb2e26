/// @file persistence.hpp
/// @brief Snapshots, log segments, compaction and restore for rooms.

#pragma once

#include <scenesync/blob_store.hpp>
#include <scenesync/document.hpp>
#include <scenesync/error.hpp>
#include <scenesync/op.hpp>
#include <scenesync/types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace scenesync {

/// Tuning for PersistenceService.
struct PersistenceOptions {
    std::chrono::milliseconds snapshot_interval{30'000};  ///< Snapshot after this much activity.
    std::size_t snapshot_every_ops{500};                   ///< ...or after this many ops.
    std::size_t retain_generations{1};                     ///< Snapshots kept behind the latest.
    std::chrono::milliseconds retry_initial{200};          ///< First retry delay.
    std::chrono::milliseconds retry_max{10'000};           ///< Retry delay cap.
    std::size_t max_attempts{6};                           ///< Attempts before giving up.
    std::string writer{"local"};                           ///< Instance id in blob keys.
};

/// Outcome of an asynchronous snapshot job.
struct SnapshotOutcome {
    RoomId doc;
    bool ok{false};
    bool cancelled{false};
    std::string key;                ///< Snapshot key when ok.
    std::size_t attempts{0};
    std::optional<Error> error;     ///< Last failure when not ok.
};

/// Blob key of a snapshot: `snapshots/<doc>/<total:020>-<writer>`.
auto snapshot_key(const RoomId& doc, std::uint64_t total, const std::string& writer) -> std::string;

/// Blob key of a log segment: `log/<doc>/<seq:020>-<writer>`.
auto log_key(const RoomId& doc, std::uint64_t seq, const std::string& writer) -> std::string;

/// Durable state for rooms on top of a BlobStore.
///
/// The synchronous operations throw scenesync::Exception (transient_storage)
/// when the store fails. submit_snapshot() runs the write on the Taskflow
/// executor and retries with exponential backoff, so callers never block on
/// storage. A failed attempt releases its executor worker; a timer thread
/// resubmits the job once its backoff has elapsed.
///
/// Restore safety: compaction only removes log segments fully covered by the
/// snapshot `retain_generations` behind the latest, so losing the latest
/// snapshot to corruption never loses operations.
class PersistenceService {
public:
    using Callback = std::function<void(const SnapshotOutcome&)>;

    PersistenceService(std::shared_ptr<BlobStore> store, PersistenceOptions options = {});

    /// Cancels pending retries and waits for running jobs.
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    auto operator=(const PersistenceService&) -> PersistenceService& = delete;

    auto options() const -> const PersistenceOptions& { return options_; }

    // -- Synchronous ----------------------------------------------------------

    /// Append a batch of ops as a new log segment. Returns its key.
    auto append_log(const RoomId& doc, std::span<const Op> ops) -> std::string;

    /// Write a snapshot of `state`. Returns its key.
    auto snapshot(const RoomId& doc, const Document& state) -> std::string;

    /// Delete snapshots and log segments no longer needed for a safe restore.
    /// Returns the number of blobs removed.
    auto compact(const RoomId& doc) -> std::size_t;

    /// Rebuild a document from its latest valid snapshot plus later log
    /// segments, falling back to older snapshots when one is corrupt.
    /// @return nullopt if nothing is stored for `doc`.
    /// @throws scenesync::Exception (corrupt_snapshot) if stored data exists
    ///   but no consistent document can be rebuilt from it.
    auto restore(const RoomId& doc) -> std::optional<Document>;

    // -- Asynchronous ---------------------------------------------------------

    /// Snapshot (then compact) in the background, retrying failed writes.
    /// @return false if a job for `doc` is already pending.
    auto submit_snapshot(const RoomId& doc, Document state, Callback on_done = {}) -> bool;

    /// Cancel the pending job for `doc`, if any. Its callback reports cancelled.
    void cancel(const RoomId& doc);

    /// Whether a job for `doc` is pending.
    auto pending(const RoomId& doc) const -> bool;

    /// Block until no job is pending.
    void wait_idle();

    /// Delay before retry number `attempt` (1-based).
    auto backoff(std::size_t attempt) const -> std::chrono::milliseconds;

private:
    struct Job;
    using Clock = std::chrono::steady_clock;

    void dispatch(std::shared_ptr<Job> job);
    void run_attempt(std::shared_ptr<Job> job);
    void retry_later(std::shared_ptr<Job> job, Clock::time_point due);
    void finish(const std::shared_ptr<Job>& job);
    void run_timer(std::stop_token stop);

    std::shared_ptr<BlobStore> store_;
    PersistenceOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<RoomId, std::shared_ptr<Job>> jobs_;
    std::size_t active_{0};  // submitted jobs whose callback has not returned
    std::uint64_t next_log_seq_;

    // Jobs waiting out their backoff, keyed by when they are due.
    std::multimap<Clock::time_point, std::shared_ptr<Job>> retries_;
    std::condition_variable_any timer_cv_;
    std::jthread timer_;  // last member: stopped before the rest is destroyed
};

}  // namespace scenesync
