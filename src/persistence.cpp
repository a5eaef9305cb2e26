#include <scenesync/persistence.hpp>

#include <scenesync/codec.hpp>
#include <scenesync/log.hpp>

#include "executor.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <stdexcept>

namespace scenesync {

auto snapshot_key(const RoomId& doc, std::uint64_t total, const std::string& writer) -> std::string {
    return fmt::format("snapshots/{}/{:020}-{}", doc, total, writer);
}

auto log_key(const RoomId& doc, std::uint64_t seq, const std::string& writer) -> std::string {
    return fmt::format("log/{}/{:020}-{}", doc, seq, writer);
}

namespace {

auto snapshot_prefix(const RoomId& doc) -> std::string { return "snapshots/" + doc + "/"; }
auto log_prefix(const RoomId& doc) -> std::string { return "log/" + doc + "/"; }

}  // namespace

struct PersistenceService::Job {
    RoomId doc;
    Document state;
    Callback on_done;
    SnapshotOutcome outcome;
    std::atomic<bool> cancelled{false};
};

PersistenceService::PersistenceService(std::shared_ptr<BlobStore> store, PersistenceOptions options)
    : store_{std::move(store)},
      options_{std::move(options)},
      next_log_seq_{static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::system_clock::now().time_since_epoch()).count())},
      timer_{[this](std::stop_token stop) { run_timer(std::move(stop)); }} {
    if (!store_) throw std::invalid_argument("PersistenceService requires a blob store");
}

PersistenceService::~PersistenceService() {
    auto waiting = std::vector<std::shared_ptr<Job>>{};
    {
        auto lock = std::lock_guard{mutex_};
        for (auto& [doc, job] : jobs_) job->cancelled = true;
        for (auto& [due, job] : retries_) waiting.push_back(std::move(job));
        retries_.clear();
    }
    for (auto& job : waiting) dispatch(std::move(job));
    wait_idle();
}

// -- Synchronous --------------------------------------------------------------

auto PersistenceService::append_log(const RoomId& doc, std::span<const Op> ops) -> std::string {
    auto seq = std::uint64_t{0};
    {
        auto lock = std::lock_guard{mutex_};
        seq = next_log_seq_++;
    }
    auto key = log_key(doc, seq, options_.writer);
    auto blob = encode_ops(ops);
    if (!store_->put(key, blob)) {
        throw Exception{ErrorKind::transient_storage, "log segment already exists: " + key};
    }
    log::get()->debug("persisted {} ops for {} as {}", ops.size(), doc, key);
    return key;
}

auto PersistenceService::snapshot(const RoomId& doc, const Document& state) -> std::string {
    auto key = snapshot_key(doc, state.watermark().total(), options_.writer);
    auto blob = state.save();
    if (!store_->put(key, blob)) {
        log::get()->debug("snapshot {} already stored", key);
    } else {
        log::get()->info("snapshot {} written ({} bytes)", key, blob.size());
    }
    return key;
}

auto PersistenceService::compact(const RoomId& doc) -> std::size_t {
    auto snapshots = store_->list(snapshot_prefix(doc));
    if (snapshots.size() <= options_.retain_generations) return 0;

    const auto boundary = snapshots.size() - 1 - options_.retain_generations;
    auto blob = store_->get(snapshots[boundary]);
    auto base = blob ? Document::load(*blob) : std::nullopt;
    if (!base) {
        log::get()->warn("compaction of {} skipped: snapshot {} is unreadable",
                         doc, snapshots[boundary]);
        return 0;
    }
    const auto covered = base->watermark();

    auto removed = std::size_t{0};
    for (std::size_t i = 0; i < boundary; ++i) {
        store_->remove(snapshots[i]);
        ++removed;
    }
    for (const auto& key : store_->list(log_prefix(doc))) {
        auto segment = store_->get(key);
        auto ops = segment ? decode_ops(*segment) : std::nullopt;
        if (!ops) {
            log::get()->warn("compaction of {}: keeping unreadable log segment {}", doc, key);
            continue;
        }
        auto all_covered = std::ranges::all_of(*ops, [&](const Op& op) {
            return covered.covers(op.origin(), op.seq);
        });
        if (all_covered) {
            store_->remove(key);
            ++removed;
        }
    }
    log::get()->info("compacted {}: removed {} blobs", doc, removed);
    return removed;
}

auto PersistenceService::restore(const RoomId& doc) -> std::optional<Document> {
    auto snapshots = store_->list(snapshot_prefix(doc));
    auto segments = store_->list(log_prefix(doc));
    if (snapshots.empty() && segments.empty()) return std::nullopt;

    auto base = std::optional<Document>{};
    for (auto it = snapshots.rbegin(); it != snapshots.rend() && !base; ++it) {
        auto blob = store_->get(*it);
        if (!blob) continue;
        base = Document::load(*blob);
        if (!base) log::get()->warn("snapshot {} is corrupt, falling back", *it);
    }

    auto replay = std::vector<Op>{};
    for (const auto& key : segments) {
        auto segment = store_->get(key);
        if (!segment) continue;
        auto ops = decode_ops(*segment);
        if (!ops) {
            throw Exception{ErrorKind::corrupt_snapshot, "corrupt log segment " + key};
        }
        replay.insert(replay.end(), std::make_move_iterator(ops->begin()),
                      std::make_move_iterator(ops->end()));
    }

    const bool from_genesis = !base;
    auto result = base ? std::move(*base) : Document{};
    result.merge(replay);

    if (from_genesis && !snapshots.empty()) {
        // Every snapshot is unreadable. Replaying the log alone is only
        // correct if no prefix of it was compacted away.
        const auto applied = result.watermark();
        auto complete = std::ranges::all_of(replay, [&](const Op& op) {
            return applied.covers(op.origin(), op.seq);
        });
        if (!complete) {
            throw Exception{ErrorKind::corrupt_snapshot,
                            "every snapshot of " + doc + " is corrupt and the log is incomplete"};
        }
    }
    log::get()->info("restored {} at watermark {} ({} ops replayed)",
                     doc, result.watermark().total(), replay.size());
    return result;
}

// -- Asynchronous -------------------------------------------------------------

auto PersistenceService::backoff(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = options_.retry_initial;
    for (std::size_t i = 1; i < attempt && delay < options_.retry_max; ++i) delay *= 2;
    return std::min(delay, options_.retry_max);
}

auto PersistenceService::submit_snapshot(const RoomId& doc, Document state, Callback on_done) -> bool {
    auto job = std::make_shared<Job>();
    job->doc = doc;
    job->state = std::move(state);
    job->on_done = std::move(on_done);
    job->outcome.doc = doc;
    {
        auto lock = std::lock_guard{mutex_};
        if (jobs_.contains(doc)) return false;
        jobs_.emplace(doc, job);
        ++active_;
    }
    dispatch(std::move(job));
    return true;
}

void PersistenceService::dispatch(std::shared_ptr<Job> job) {
    detail::global_executor().silent_async([this, job = std::move(job)] { run_attempt(job); });
}

// One write attempt. A failure that may still succeed goes back to the timer
// instead of holding the worker through the backoff.
void PersistenceService::run_attempt(std::shared_ptr<Job> job) {
    auto& outcome = job->outcome;
    if (job->cancelled) {
        outcome.cancelled = true;
        finish(job);
        return;
    }
    auto attempt = ++outcome.attempts;
    try {
        outcome.key = snapshot(job->doc, job->state);
        outcome.ok = true;
        outcome.error.reset();
    } catch (const Exception& e) {
        outcome.error = e.error();
        log::get()->warn("snapshot of {} failed (attempt {}/{}): {}",
                         job->doc, attempt, options_.max_attempts, e.what());
    }
    if (outcome.ok) {
        try {
            compact(job->doc);
        } catch (const Exception& e) {
            log::get()->warn("compaction of {} failed: {}", job->doc, e.what());
        }
        finish(job);
        return;
    }
    if (attempt >= options_.max_attempts) {
        log::get()->error("snapshot of {} gave up after {} attempts", job->doc, attempt);
        finish(job);
        return;
    }
    retry_later(std::move(job), Clock::now() + backoff(attempt));
}

void PersistenceService::retry_later(std::shared_ptr<Job> job, Clock::time_point due) {
    {
        auto lock = std::lock_guard{mutex_};
        if (!job->cancelled) {
            retries_.emplace(due, std::move(job));
            timer_cv_.notify_all();
            return;
        }
    }
    dispatch(std::move(job));
}

void PersistenceService::finish(const std::shared_ptr<Job>& job) {
    {
        auto lock = std::lock_guard{mutex_};
        if (auto it = jobs_.find(job->doc); it != jobs_.end() && it->second == job) jobs_.erase(it);
    }
    if (job->on_done) job->on_done(job->outcome);
    auto lock = std::lock_guard{mutex_};
    --active_;
    idle_cv_.notify_all();
}

void PersistenceService::run_timer(std::stop_token stop) {
    auto lock = std::unique_lock{mutex_};
    while (!stop.stop_requested()) {
        if (retries_.empty()) {
            timer_cv_.wait(lock, stop, [&] { return !retries_.empty(); });
            continue;
        }
        auto due = retries_.begin()->first;
        if (Clock::now() < due) {
            // Wake early when an earlier retry is queued.
            timer_cv_.wait_until(lock, stop, due, [&] {
                return !retries_.empty() && retries_.begin()->first < due;
            });
            continue;
        }
        auto job = std::move(retries_.begin()->second);
        retries_.erase(retries_.begin());
        lock.unlock();
        dispatch(std::move(job));
        lock.lock();
    }
}

void PersistenceService::cancel(const RoomId& doc) {
    auto waiting = std::shared_ptr<Job>{};
    {
        auto lock = std::lock_guard{mutex_};
        auto it = jobs_.find(doc);
        if (it == jobs_.end()) return;
        it->second->cancelled = true;
        auto queued = std::find_if(retries_.begin(), retries_.end(),
                                   [&](const auto& entry) { return entry.second == it->second; });
        if (queued != retries_.end()) {
            waiting = std::move(queued->second);
            retries_.erase(queued);
        }
    }
    if (waiting) dispatch(std::move(waiting));
}

auto PersistenceService::pending(const RoomId& doc) const -> bool {
    auto lock = std::lock_guard{mutex_};
    return jobs_.contains(doc);
}

void PersistenceService::wait_idle() {
    auto lock = std::unique_lock{mutex_};
    idle_cv_.wait(lock, [&] { return active_ == 0; });
}

}  // namespace scenesync
