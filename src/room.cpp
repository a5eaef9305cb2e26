#include <scenesync/room.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace scenesync {

void to_json(nlohmann::json& j, const RoomStats& s) {
    j = nlohmann::json{
        {"room", s.room},
        {"sessions", s.sessions},
        {"ops_applied", s.ops_applied},
        {"watermark_total", s.watermark_total},
        {"log_size", s.log_size},
        {"pending_ops", s.pending_ops},
        {"outbox", s.outbox},
        {"unlogged_ops", s.unlogged_ops},
        {"snapshots", s.snapshots},
        {"read_only", s.read_only},
        {"age_ms", s.age.count()},
        {"idle_ms", s.idle.count()},
    };
}

Room::Room(RoomId id, Document document, Clock::time_point now)
    : id_{std::move(id)},
      document_{std::move(document)},
      created_{now},
      empty_since_{now},
      last_activity_{now} {}

// -- Membership ---------------------------------------------------------------

auto Room::attach(std::shared_ptr<Session> session) -> std::shared_ptr<Session> {
    auto lock = std::lock_guard{mutex_};
    empty_since_.reset();
    owners_.try_emplace(session->id(), session->identity().user_id);
    auto& slot = sessions_[session->id()];
    return std::exchange(slot, std::move(session));
}

auto Room::owner(const SessionId& id) const -> std::optional<std::string> {
    auto lock = std::lock_guard{mutex_};
    auto it = owners_.find(id);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

auto Room::detach(const Session& session, Clock::time_point now) -> bool {
    auto lock = std::lock_guard{mutex_};
    auto it = sessions_.find(session.id());
    if (it == sessions_.end() || it->second.get() != &session) return false;
    sessions_.erase(it);
    if (sessions_.empty()) empty_since_ = now;
    return true;
}

auto Room::find(const SessionId& id) const -> std::shared_ptr<Session> {
    auto lock = std::lock_guard{mutex_};
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

auto Room::sessions() const -> std::vector<std::shared_ptr<Session>> {
    auto lock = std::lock_guard{mutex_};
    auto result = std::vector<std::shared_ptr<Session>>{};
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) result.push_back(session);
    return result;
}

auto Room::size() const -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    return sessions_.size();
}

auto Room::empty_since() const -> std::optional<Clock::time_point> {
    auto lock = std::lock_guard{mutex_};
    return empty_since_;
}

void Room::locked(const std::function<void()>& fn) {
    auto lock = std::lock_guard{mutex_};
    fn();
}

void Room::broadcast(const Frame& frame, const SessionId* except) const {
    auto lock = std::lock_guard{mutex_};
    for (const auto& [id, session] : sessions_) {
        if (except && id == *except) continue;
        if (session->is_active()) session->send(frame);
    }
}

// -- Bus ----------------------------------------------------------------------

void Room::hold(Subscription subscription) {
    auto lock = std::lock_guard{mutex_};
    subscriptions_.push_back(std::move(subscription));
}

void Room::release() {
    auto released = std::vector<Subscription>{};
    {
        auto lock = std::lock_guard{mutex_};
        released.swap(subscriptions_);
    }
}

auto Room::enqueue(BusMessage message, std::size_t limit) -> bool {
    auto lock = std::lock_guard{mutex_};
    outbox_.push_back(std::move(message));
    auto dropped = false;
    while (outbox_.size() > limit && !outbox_.empty()) {
        outbox_.pop_front();
        dropped = true;
    }
    return !dropped;
}

auto Room::outbox_size() const -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    return outbox_.size();
}

auto Room::take_outbox() -> std::deque<BusMessage> {
    auto lock = std::lock_guard{mutex_};
    return std::exchange(outbox_, {});
}

void Room::restore_outbox(std::deque<BusMessage> messages) {
    auto lock = std::lock_guard{mutex_};
    for (auto& m : outbox_) messages.push_back(std::move(m));
    outbox_ = std::move(messages);
}

// -- Log backlog --------------------------------------------------------------

void Room::defer_log(std::vector<Op> ops, const SessionId& waiting, Clock::time_point retry_at) {
    auto lock = std::lock_guard{mutex_};
    if (log_backlog_.ops.empty() && log_backlog_.waiting.empty()) {
        log_backlog_.attempts = 1;
        log_backlog_.retry_at = retry_at;
    }
    std::move(ops.begin(), ops.end(), std::back_inserter(log_backlog_.ops));
    log_backlog_.waiting.insert(waiting);
}

auto Room::has_log_backlog() const -> bool {
    auto lock = std::lock_guard{mutex_};
    return !log_backlog_.ops.empty() || !log_backlog_.waiting.empty();
}

auto Room::take_log_backlog(Clock::time_point now, bool force) -> std::optional<LogBacklog> {
    auto lock = std::lock_guard{mutex_};
    if (log_backlog_.ops.empty() && log_backlog_.waiting.empty()) return std::nullopt;
    if (!force && now < log_backlog_.retry_at) return std::nullopt;
    return std::exchange(log_backlog_, {});
}

void Room::restore_log_backlog(LogBacklog backlog) {
    auto lock = std::lock_guard{mutex_};
    std::move(log_backlog_.ops.begin(), log_backlog_.ops.end(), std::back_inserter(backlog.ops));
    backlog.waiting.merge(log_backlog_.waiting);
    log_backlog_ = std::move(backlog);
}

// -- Persistence bookkeeping --------------------------------------------------

void Room::record_ops(std::size_t count, Clock::time_point now) {
    if (count == 0) return;
    auto lock = std::lock_guard{mutex_};
    ops_applied_ += count;
    pending_ops_ += count;
    if (!first_pending_) first_pending_ = now;
    last_activity_ = now;
}

auto Room::snapshot_due(std::size_t every_ops, Clock::duration interval, Clock::time_point now) const
    -> bool {
    auto lock = std::lock_guard{mutex_};
    if (in_flight_ || pending_ops_ == 0) return false;
    if (every_ops > 0 && pending_ops_ >= every_ops) return true;
    return first_pending_ && now - *first_pending_ >= interval;
}

void Room::snapshot_started(const Watermark& watermark) {
    auto lock = std::lock_guard{mutex_};
    in_flight_ = watermark;
    in_flight_ops_ = pending_ops_;
}

void Room::snapshot_finished(bool ok, Clock::time_point now) {
    auto lock = std::lock_guard{mutex_};
    if (!in_flight_) return;
    if (ok) {
        if (last_snapshot_) document_.truncate_log(*last_snapshot_);
        last_snapshot_ = std::move(in_flight_);
        pending_ops_ -= std::min(pending_ops_, in_flight_ops_);
        first_pending_ = pending_ops_ > 0 ? std::optional{now} : std::nullopt;
        ++snapshots_;
    }
    in_flight_.reset();
    in_flight_ops_ = 0;
}

auto Room::snapshot_in_flight() const -> bool {
    auto lock = std::lock_guard{mutex_};
    return in_flight_.has_value();
}

auto Room::pending_ops() const -> std::size_t {
    auto lock = std::lock_guard{mutex_};
    return pending_ops_;
}

// -- Flags --------------------------------------------------------------------

auto Room::read_only() const -> bool {
    auto lock = std::lock_guard{mutex_};
    return !faults_.empty();
}

auto Room::set_fault(Fault fault, bool failing) -> bool {
    auto lock = std::lock_guard{mutex_};
    auto before = !faults_.empty();
    if (failing) {
        faults_.insert(fault);
    } else {
        faults_.erase(fault);
    }
    return before != !faults_.empty();
}

auto Room::closing() const -> bool {
    auto lock = std::lock_guard{mutex_};
    return closing_;
}

void Room::set_closing() {
    auto lock = std::lock_guard{mutex_};
    closing_ = true;
}

auto Room::stats(Clock::time_point now) const -> RoomStats {
    auto lock = std::lock_guard{mutex_};
    auto ms = [](Clock::duration d) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d);
    };
    return RoomStats{
        .room = id_,
        .sessions = sessions_.size(),
        .ops_applied = ops_applied_,
        .watermark_total = document_.watermark().total(),
        .log_size = document_.log_size(),
        .pending_ops = pending_ops_,
        .outbox = outbox_.size(),
        .unlogged_ops = log_backlog_.ops.size(),
        .snapshots = snapshots_,
        .read_only = !faults_.empty(),
        .age = ms(now - created_),
        .idle = ms(now - last_activity_),
    };
}

}  // namespace scenesync
