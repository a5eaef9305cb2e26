#include <scenesync/session_manager.hpp>

#include <scenesync/log.hpp>
#include <scenesync/scene_json.hpp>

#include <stdexcept>
#include <thread>
#include <utility>

namespace scenesync {

namespace {

// Fixed origin of the ops that seed a new document.
constexpr std::uint8_t seed_session_bytes[SessionId::size] = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};

auto reject_code_for(AuthFailure failure) -> RejectCode {
    switch (failure) {
        case AuthFailure::unauthenticated:    return RejectCode::unauthenticated;
        case AuthFailure::unauthorized:       return RejectCode::unauthorized;
        case AuthFailure::document_not_found: return RejectCode::document_not_found;
    }
    return RejectCode::unauthenticated;
}

auto short_id(const SessionId& id) -> std::string {
    return id.to_hex().substr(0, 8);
}

}  // anonymous namespace

auto seed_ops() -> const std::vector<Op>& {
    static const auto ops = [] {
        auto seed = Document{};
        seed.set_session_id(SessionId{seed_session_bytes});
        return seed.commit(import_scene_graph(default_scene_graph())).ops;
    }();
    return ops;
}

auto SessionManagerOptions::from_config(const Config& config) -> SessionManagerOptions {
    return SessionManagerOptions{
        .instance_id = config.instance_id,
        .heartbeat_timeout = config.heartbeat_timeout,
        .room_grace = config.room_grace,
        .rate_limit_per_room = config.rate_limit_per_room,
        .rate_limit_window = config.rate_limit_window,
        .outbox_limit = config.outbox_limit,
        .presence = PresenceTracker::Options{
            .idle_after = config.presence_idle_after,
            .idle_timeout = config.presence_timeout,
            .broadcast_interval = config.presence_interval,
        },
    };
}

void to_json(nlohmann::json& j, const ManagerStats& s) {
    j = nlohmann::json{
        {"instance", s.instance},
        {"rooms", s.rooms},
        {"sessions", s.sessions},
        {"room_stats", s.room_stats},
    };
}

SessionManager::SessionManager(SessionManagerOptions options,
                               std::shared_ptr<Authorizer> authorizer,
                               std::shared_ptr<PersistenceService> persistence,
                               std::shared_ptr<FanoutBus> bus,
                               std::shared_ptr<RoomRegistry> registry)
    : options_{std::move(options)},
      authorizer_{std::move(authorizer)},
      persistence_{std::move(persistence)},
      bus_{std::move(bus)},
      registry_{std::move(registry)},
      rate_limiter_{options_.rate_limit_per_room, options_.rate_limit_window},
      presence_{options_.presence},
      bus_epoch_{bus_ ? bus_->epoch() : 0} {
    if (!authorizer_ || !persistence_ || !bus_ || !registry_) {
        throw std::invalid_argument{"SessionManager requires an authorizer, persistence, bus and registry"};
    }
    if (options_.instance_id.empty()) options_.instance_id = SessionId::random().to_hex().substr(0, 12);
}

SessionManager::~SessionManager() {
    stopping_ = true;
    for (const auto& room : registry_->rooms()) {
        room->release();
        persistence_->cancel(room->id());
    }
    persistence_->wait_idle();
}

// -- Connection lifecycle -----------------------------------------------------

void SessionManager::reject(Connection& connection, RejectCode code, std::string message,
                            std::optional<std::chrono::milliseconds> retry_after) {
    log::get()->warn("connection rejected ({}): {}", to_string_view(code), message);
    connection.send(RejectFrame{.code = code, .message = message, .retry_after = retry_after});
    connection.close(close_code::policy_violation, message);
}

auto SessionManager::connect(std::shared_ptr<Connection> connection, const ConnectFrame& frame,
                             std::string_view peer, Clock::time_point now)
    -> std::shared_ptr<Session> {
    if (stopping_) {
        connection->send(ErrorFrame{.code = ErrorKind::transient_storage,
                                    .message = "server is shutting down"});
        connection->close(close_code::going_away, "server is shutting down");
        return nullptr;
    }

    auto limit = rate_limiter_.allow(frame.document + ":" + std::string{peer}, now);
    if (!limit.allowed) {
        reject(*connection, RejectCode::rate_limited,
               "too many connections to " + frame.document, limit.retry_after);
        return nullptr;
    }

    // authenticating
    auto decision = AuthDecision::deny(AuthFailure::unauthenticated);
    try {
        decision = authorizer_->authorize(frame.token, frame.document);
    } catch (const std::exception& e) {
        log::get()->error("authorizer failed for {}: {}", frame.document, e.what());
        reject(*connection, RejectCode::unauthenticated, "authorization unavailable");
        return nullptr;
    }
    if (!decision) {
        reject(*connection, reject_code_for(decision.failure),
               std::string{to_string_view(decision.failure)} + " for " + frame.document);
        return nullptr;
    }

    std::shared_ptr<Session> session;
    std::shared_ptr<Room> room;
    std::shared_ptr<Session> replaced;
    auto foreign = false;
    for (auto attached = false; !attached && !foreign;) {
        try {
            room = open_room(frame.document, now);
        } catch (const Exception& e) {
            log::get()->error("cannot open {}: {}", frame.document, e.what());
            connection->send(ErrorFrame{.code = e.kind(), .message = e.what()});
            connection->close(close_code::internal_error, "document unavailable");
            return nullptr;
        }

        room->locked([&] {
            if (room->closing()) return;

            // A resumed id must belong to the same user. An id this room has
            // never seen is not trusted and gets replaced by a fresh one.
            auto session_id = SessionId::random();
            if (frame.resume) {
                auto owner = room->owner(frame.resume->session_id);
                if (owner && *owner != decision.identity->user_id) {
                    foreign = true;
                    return;
                }
                if (owner) session_id = frame.resume->session_id;
            }
            session = std::make_shared<Session>(session_id, *decision.identity, frame.document,
                                                connection, now);
            session->set_state(SessionState::authenticating);
            replaced = room->attach(session);
            session->set_state(SessionState::joined);

            auto& doc = room->document();
            auto accept = AcceptFrame{.session_id = session_id, .watermark = doc.watermark()};
            auto delta = frame.resume ? doc.ops_since(frame.resume->watermark) : std::nullopt;
            if (delta) {
                accept.mode = SyncMode::delta;
                accept.ops = std::move(*delta);
            } else {
                accept.mode = SyncMode::full;
                accept.state = doc.state();
            }
            for (auto& [id, entry] : presence_.snapshot(room->id())) {
                if (id != session_id) accept.presence.insert_or_assign(id, std::move(entry));
            }
            session->send(accept);
            session->set_state(SessionState::active);
            attached = true;

            log::get()->info("session {} ({}) joined {} [{} sync, {} sessions]",
                             short_id(session_id), session->identity().user_id, room->id(),
                             accept.mode == SyncMode::delta ? "delta" : "full", room->size());
        });
        if (!attached && !foreign) std::this_thread::yield();
    }
    if (foreign) {
        reject(*connection, RejectCode::unauthorized,
               "session " + short_id(frame.resume->session_id) + " belongs to another user");
        return nullptr;
    }

    if (replaced) {
        replaced->set_state(SessionState::closed);
        replaced->connection()->close(close_code::normal, "replaced by a newer connection");
    }

    auto user = nlohmann::json::object();
    if (frame.user.is_object()) {
        for (const auto* key : {"name", "color"}) {
            if (frame.user.contains(key)) user[key] = frame.user[key];
        }
    }
    if (!user.contains("name") && !session->identity().display_name.empty()) {
        user["name"] = session->identity().display_name;
    }
    presence_.set_local(room->id(), session->id(), session->identity().user_id,
                        nlohmann::json{{"user", user}}, now);
    return session;
}

void SessionManager::handle_text(const std::shared_ptr<Session>& session, std::string_view text,
                                 Clock::time_point now) {
    auto frame = Frame{};
    try {
        frame = parse_frame(text);
    } catch (const Exception& e) {
        session->touch(now);
        session->send(ErrorFrame{.code = e.kind(), .message = e.what()});
        return;
    }
    handle_frame(session, frame, now);
}

void SessionManager::handle_frame(const std::shared_ptr<Session>& session, const Frame& frame,
                                  Clock::time_point now) {
    if (!session->is_active()) return;
    session->touch(now);

    auto room = registry_->find(session->room());
    if (!room || !room->find(session->id())) return;

    std::visit(overload{
        [&](const OperationFrame& f) { on_operation(session, room, f, now); },
        [&](const PresenceFrame& f) { on_presence(session, f, now); },
        [&](const AckFrame& f) { session->ack(f.watermark); },
        [&](const PingFrame&) { session->send(PongFrame{}); },
        [](const PongFrame&) {},
        [&](const ConnectFrame&) {
            session->send(ErrorFrame{.code = ErrorKind::invalid_frame, .message = "already connected"});
        },
        [&](const auto&) {
            session->send(ErrorFrame{.code = ErrorKind::invalid_frame,
                                     .message = "unexpected frame " + std::string{frame_type(frame)}});
        },
    }, frame);
}

void SessionManager::disconnect(const std::shared_ptr<Session>& session, Clock::time_point now) {
    drop(session, close_code::normal, "bye", now);
}

void SessionManager::drop(const std::shared_ptr<Session>& session, std::uint16_t code,
                          std::string_view reason, Clock::time_point now) {
    auto state = session->state();
    if (state == SessionState::closed || state == SessionState::disconnecting) return;
    session->set_state(SessionState::disconnecting);

    if (auto room = registry_->find(session->room()); room && room->detach(*session, now)) {
        presence_.remove(room->id(), session->id());
        log::get()->info("session {} left {} ({} sessions)",
                         short_id(session->id()), room->id(), room->size());
    }
    session->connection()->close(code, reason);
    session->set_state(SessionState::closed);
}

// -- Rooms --------------------------------------------------------------------

auto SessionManager::build_room(const RoomId& id, Clock::time_point now) -> std::shared_ptr<Room> {
    auto restored = persistence_->restore(id);
    auto doc = restored ? std::move(*restored) : Document{};
    doc.merge(seed_ops());
    log::get()->info("room {} created ({})", id, restored ? "restored" : "new document");
    return std::make_shared<Room>(id, std::move(doc), now);
}

auto SessionManager::open_room(const RoomId& id, Clock::time_point now) -> std::shared_ptr<Room> {
    auto [room, created] = registry_->get_or_create(id, [&](const RoomId& rid) {
        return build_room(rid, now);
    });
    if (created) wire_room(room);
    return room;
}

void SessionManager::wire_room(const std::shared_ptr<Room>& room) {
    auto weak = std::weak_ptr<Room>{room};
    room->hold(bus_->subscribe(room->id(), [this, weak](const BusMessage& m) {
        on_bus_message(weak, m);
    }));
    room->hold(presence_.on_change(room->id(), [this, weak](const PresenceUpdate& u) {
        on_presence_update(weak, u);
    }));
}

// -- Inbound ------------------------------------------------------------------

void SessionManager::on_operation(const std::shared_ptr<Session>& session,
                                  const std::shared_ptr<Room>& live, const OperationFrame& frame,
                                  Clock::time_point now) {
    auto& room = *live;
    if (room.read_only()) {
        session->send(ErrorFrame{.code = ErrorKind::transient_storage,
                                 .message = "room is read-only until storage recovers"});
        return;
    }

    auto fresh = std::vector<Op>{};
    auto rejected = std::size_t{0};
    for (const auto& op : frame.ops) {
        if (op.origin() != session->id()) {
            ++rejected;
            continue;
        }
        auto result = room.document().apply_local(op);
        if (!result.accepted) {
            ++rejected;
        } else if (!result.duplicate) {
            fresh.push_back(op);
        }
    }
    if (rejected > 0) {
        log::get()->warn("session {} sent {} invalid ops to {}",
                         short_id(session->id()), rejected, room.id());
        session->send(ErrorFrame{.code = ErrorKind::validation_rejected,
                                 .message = std::to_string(rejected) + " op(s) rejected"});
    }

    auto logged = log_ops(room, session->id(), fresh, now);
    if (!fresh.empty()) {
        room.record_ops(fresh.size(), now);
        room.broadcast(OperationFrame{.ops = fresh}, &session->id());
        publish(room, BusMessage{.type = BusMessageType::operation,
                                 .instance = options_.instance_id,
                                 .room = room.id(),
                                 .payload = nlohmann::json{{"ops", fresh}}});
        maybe_snapshot(live, now, false);
    }
    // The ack waits until the log holds everything it covers.
    if (logged) session->send(AckFrame{.watermark = room.document().watermark()});
}

void SessionManager::on_presence(const std::shared_ptr<Session>& session, const PresenceFrame& frame,
                                 Clock::time_point now) {
    if (!frame.state) {
        session->send(ErrorFrame{.code = ErrorKind::invalid_frame, .message = "presence needs a state"});
        return;
    }
    try {
        presence_.set_local(session->room(), session->id(), session->identity().user_id,
                            *frame.state, now);
    } catch (const Exception& e) {
        session->send(ErrorFrame{.code = e.kind(), .message = e.what()});
    }
}

void SessionManager::on_bus_message(const std::weak_ptr<Room>& weak, const BusMessage& message) {
    if (message.instance == options_.instance_id) return;
    auto room = weak.lock();
    if (!room || room->closing()) return;

    try {
        switch (message.type) {
            case BusMessageType::operation: {
                auto ops = message.payload.at("ops").get<std::vector<Op>>();
                auto fresh = std::vector<Op>{};
                for (auto& op : ops) {
                    if (room->document().merge(op)) fresh.push_back(std::move(op));
                }
                if (fresh.empty()) return;
                room->record_ops(fresh.size(), Clock::now());
                room->broadcast(OperationFrame{.ops = std::move(fresh)});
                return;
            }
            case BusMessageType::presence: {
                auto frame = PresenceFrame{};
                for (const auto& [hex, entry] : message.payload.at("sessions").items()) {
                    auto id = SessionId::from_hex(hex);
                    if (id) frame.sessions.emplace(*id, entry);
                }
                auto now = Clock::now();
                for (const auto& [id, entry] : frame.sessions) {
                    presence_.apply_remote(room->id(), id, entry, now);
                }
                room->broadcast(frame);
                return;
            }
            case BusMessageType::presence_leave: {
                presence_.remove(room->id(), message.payload.at("session").get<SessionId>());
                return;
            }
        }
    } catch (const std::exception& e) {
        log::get()->warn("dropping malformed bus message for {} from {}: {}",
                         message.room, message.instance, e.what());
    }
}

void SessionManager::on_presence_update(const std::weak_ptr<Room>& weak, const PresenceUpdate& update) {
    auto room = weak.lock();
    if (!room) return;
    room->broadcast(PresenceFrame{.sessions = update.sessions, .removed = update.removed});

    // Entries owned by other processes are theirs to announce.
    if (!update.sessions.empty()) {
        auto sessions = nlohmann::json::object();
        for (const auto& [id, entry] : update.sessions) sessions[id.to_hex()] = entry;
        publish(*room, BusMessage{.type = BusMessageType::presence,
                                  .instance = options_.instance_id,
                                  .room = room->id(),
                                  .payload = nlohmann::json{{"sessions", sessions}}});
    }
    for (const auto& id : update.removed) {
        if (update.remote.contains(id)) continue;
        publish(*room, BusMessage{.type = BusMessageType::presence_leave,
                                  .instance = options_.instance_id,
                                  .room = room->id(),
                                  .payload = nlohmann::json{{"session", id}}});
    }
}

// -- Fan-out ------------------------------------------------------------------

void SessionManager::publish(Room& room, BusMessage message) {
    if (room.outbox_size() > 0) {
        // Keep per-room order: queued messages go first.
        room.enqueue(std::move(message), options_.outbox_limit);
        flush_outbox(room);
        return;
    }
    try {
        bus_->publish(message);
    } catch (const Exception& e) {
        log::get()->warn("bus publish for {} failed, queueing: {}", room.id(), e.what());
        if (!room.enqueue(std::move(message), options_.outbox_limit)) {
            log::get()->error("outbox for {} is full, dropped the oldest message", room.id());
        }
    }
}

void SessionManager::flush_outbox(Room& room) {
    auto queued = room.take_outbox();
    if (queued.empty()) return;
    auto sent = std::size_t{0};
    while (!queued.empty()) {
        try {
            bus_->publish(queued.front());
        } catch (const Exception& e) {
            log::get()->debug("outbox for {} still blocked: {}", room.id(), e.what());
            break;
        }
        queued.pop_front();
        ++sent;
    }
    if (!queued.empty()) room.restore_outbox(std::move(queued));
    if (sent > 0) log::get()->info("resent {} queued bus messages for {}", sent, room.id());
}

// -- Persistence --------------------------------------------------------------

auto SessionManager::log_ops(Room& room, const SessionId& author, std::vector<Op> ops,
                             Clock::time_point now) -> bool {
    // Behind a backlog, new ops queue up so the log keeps their order.
    if (room.has_log_backlog()) {
        room.defer_log(std::move(ops), author, now);
        return false;
    }
    if (ops.empty()) return true;
    try {
        persistence_->append_log(room.id(), ops);
        return true;
    } catch (const Exception& e) {
        log::get()->warn("log append for {} failed, retrying: {}", room.id(), e.what());
        room.defer_log(std::move(ops), author, now + persistence_->backoff(1));
        return false;
    }
}

void SessionManager::retry_log(Room& room, Clock::time_point now, bool force) {
    auto backlog = room.take_log_backlog(now, force);
    if (!backlog) return;
    auto watermark = room.document().watermark();
    if (!backlog->ops.empty()) {
        try {
            persistence_->append_log(room.id(), backlog->ops);
        } catch (const Exception& e) {
            auto attempts = ++backlog->attempts;
            auto exhausted = attempts >= persistence_->options().max_attempts;
            log::get()->warn("log append for {} failed (attempt {}/{}): {}", room.id(), attempts,
                             persistence_->options().max_attempts, e.what());
            backlog->retry_at = now + persistence_->backoff(attempts);
            room.restore_log_backlog(std::move(*backlog));
            if (exhausted) set_fault(room, Room::Fault::log, true);
            return;
        }
        log::get()->info("logged {} deferred ops for {}", backlog->ops.size(), room.id());
    }
    set_fault(room, Room::Fault::log, false);
    for (const auto& id : backlog->waiting) {
        if (auto session = room.find(id)) session->send(AckFrame{.watermark = watermark});
    }
}

void SessionManager::set_fault(Room& room, Room::Fault fault, bool failing) {
    if (!room.set_fault(fault, failing)) return;
    room.broadcast(DegradedFrame{.read_only = failing});
    if (failing) {
        log::get()->error("room {} is read-only: {} writes keep failing", room.id(),
                          fault == Room::Fault::log ? "log" : "snapshot");
    } else {
        log::get()->info("room {} is writable again", room.id());
    }
}

void SessionManager::catch_up(const std::shared_ptr<Room>& room, Clock::time_point now) {
    auto stored = std::optional<Document>{};
    try {
        stored = persistence_->restore(room->id());
    } catch (const Exception& e) {
        log::get()->error("catch-up of {} after a bus break failed: {}", room->id(), e.what());
        return;
    }
    if (!stored) return;
    auto missing = stored->ops_since(room->document().watermark());
    if (!missing) {
        // The stored log no longer reaches back to what this room has.
        log::get()->warn("room {} fell too far behind during a bus break, reloading", room->id());
        close_room(room->id(), "resynchronizing", now);
        return;
    }
    auto fresh = std::vector<Op>{};
    for (auto& op : *missing) {
        if (room->document().merge(op)) fresh.push_back(std::move(op));
    }
    if (fresh.empty()) return;
    log::get()->info("recovered {} ops for {} missed during a bus break", fresh.size(), room->id());
    room->record_ops(fresh.size(), now);
    room->broadcast(OperationFrame{.ops = std::move(fresh)});
}

void SessionManager::maybe_snapshot(const std::shared_ptr<Room>& room, Clock::time_point now,
                                    bool force) {
    const auto& opts = persistence_->options();
    if (room->snapshot_in_flight() || room->pending_ops() == 0) return;
    if (!force && !room->snapshot_due(opts.snapshot_every_ops, opts.snapshot_interval, now)) return;

    // One writer per room across processes; the others skip this round.
    try {
        if (!bus_->try_lock(lock_key(room->id(), "snapshot"), options_.instance_id,
                            options_.snapshot_lock_ttl)) {
            log::get()->debug("snapshot of {} skipped, another instance holds the lock", room->id());
            return;
        }
    } catch (const Exception& e) {
        log::get()->warn("snapshot of {} skipped, lock unavailable: {}", room->id(), e.what());
        return;
    }

    auto copy = room->document();
    room->snapshot_started(copy.watermark());
    auto weak = std::weak_ptr<Room>{room};
    auto submitted = persistence_->submit_snapshot(room->id(), std::move(copy),
        [this, weak](const SnapshotOutcome& outcome) { snapshot_done(weak, outcome); });
    if (!submitted) {
        room->snapshot_finished(false, now);
        release_snapshot_lock(room->id());
    }
}

void SessionManager::release_snapshot_lock(const RoomId& id) {
    try {
        bus_->unlock(lock_key(id, "snapshot"), options_.instance_id);
    } catch (const Exception& e) {
        log::get()->warn("snapshot lock of {} left to expire: {}", id, e.what());
    }
}

void SessionManager::snapshot_done(const std::weak_ptr<Room>& weak, const SnapshotOutcome& outcome) {
    release_snapshot_lock(outcome.doc);
    auto room = weak.lock();
    if (!room) return;
    room->snapshot_finished(outcome.ok, Clock::now());
    if (outcome.cancelled) return;
    if (!outcome.ok) {
        log::get()->error("snapshot of {} failed after {} attempts", room->id(), outcome.attempts);
    }
    set_fault(*room, Room::Fault::snapshot, !outcome.ok);
}

void SessionManager::evict(const std::shared_ptr<Room>& room, std::string_view reason) {
    persistence_->cancel(room->id());
    retry_log(*room, Clock::now(), true);
    if (room->has_log_backlog()) {
        log::get()->error("room {} evicted with unlogged ops; only the final snapshot holds them",
                          room->id());
    }
    if (room->pending_ops() > 0) final_snapshot(*room);
    flush_outbox(*room);
    registry_->remove(room);
    room->release();
    presence_.clear(room->id());
    log::get()->info("room {} evicted ({})", room->id(), reason);
}

void SessionManager::final_snapshot(Room& room) {
    auto key = lock_key(room.id(), "snapshot");
    auto locked = true;
    try {
        if (!bus_->try_lock(key, options_.instance_id, options_.snapshot_lock_ttl)) {
            if (!room.has_log_backlog()) {
                log::get()->info("final snapshot of {} left to the instance holding the lock", room.id());
                return;
            }
            locked = false;
        }
    } catch (const Exception& e) {
        log::get()->warn("final snapshot of {} taken without the lock: {}", room.id(), e.what());
        locked = false;
    }
    try {
        persistence_->snapshot(room.id(), room.document());
        persistence_->compact(room.id());
    } catch (const Exception& e) {
        log::get()->error("final snapshot of {} failed, the log still holds its ops: {}",
                          room.id(), e.what());
    }
    if (locked) release_snapshot_lock(room.id());
}

// -- Maintenance --------------------------------------------------------------

void SessionManager::tick(Clock::time_point now) {
    rate_limiter_.prune(now);
    presence_.tick(now);

    // Messages published while the bus was broken are read back from the log.
    auto epoch = bus_->epoch();
    auto resumed = bus_epoch_.exchange(epoch) != epoch;

    for (const auto& room : registry_->rooms()) {
        if (resumed) catch_up(room, now);
        if (room->closing()) continue;
        for (const auto& session : room->sessions()) {
            if (now - session->last_seen() > options_.heartbeat_timeout) {
                log::get()->info("session {} in {} timed out", short_id(session->id()), room->id());
                drop(session, close_code::going_away, "heartbeat timeout", now);
            }
        }
        if (bus_->available()) flush_outbox(*room);
        retry_log(*room, now, false);
        maybe_snapshot(room, now, room->read_only());
    }

    for (const auto& room : registry_->idle_rooms(now, options_.room_grace)) {
        auto claimed = false;
        room->locked([&] {
            if (room->size() == 0 && !room->closing()) {
                room->set_closing();
                claimed = true;
            }
        });
        if (claimed) evict(room, "idle");
    }
}

auto SessionManager::close_room(const RoomId& id, std::string_view reason, Clock::time_point now)
    -> bool {
    auto room = registry_->find(id);
    if (!room) return false;

    auto sessions = std::vector<std::shared_ptr<Session>>{};
    room->locked([&] {
        room->set_closing();
        room->broadcast(RoomClosingFrame{.reason = std::string{reason}});
        sessions = room->sessions();
    });
    for (const auto& session : sessions) {
        session->set_state(SessionState::disconnecting);
        if (room->detach(*session, now)) presence_.remove(id, session->id());
        session->connection()->close(close_code::going_away, reason);
        session->set_state(SessionState::closed);
    }
    evict(room, reason);
    return true;
}

void SessionManager::shutdown(Clock::time_point now) {
    stopping_ = true;
    for (const auto& room : registry_->rooms()) close_room(room->id(), "server shutting down", now);
    persistence_->wait_idle();
}

// -- Introspection ------------------------------------------------------------

auto SessionManager::stats(Clock::time_point now) const -> ManagerStats {
    auto result = ManagerStats{.instance = options_.instance_id};
    for (const auto& room : registry_->rooms()) {
        auto s = room->stats(now);
        result.sessions += s.sessions;
        result.room_stats.push_back(std::move(s));
    }
    result.rooms = result.room_stats.size();
    return result;
}

auto SessionManager::room_stats(const RoomId& id, Clock::time_point now) const
    -> std::optional<RoomStats> {
    auto room = registry_->find(id);
    if (!room) return std::nullopt;
    return room->stats(now);
}

}  // namespace scenesync
