/// @file watermark.hpp
/// @brief Watermark: a version vector of contiguous per-session sequence numbers.

#pragma once

#include <scenesync/types.hpp>

#include <algorithm>
#include <cstdint>
#include <map>

namespace scenesync {

/// How much of the operation history a document, snapshot or session reflects.
///
/// For each origin session the watermark stores the highest sequence number
/// `n` such that ops `1..n` from that session have all been applied. An op is
/// covered by the watermark when its seq is at or below its origin's entry.
class Watermark {
public:
    Watermark() = default;

    /// The contiguous sequence number seen for a session (0 if none).
    auto get(const SessionId& session) const -> std::uint64_t {
        auto it = entries_.find(session);
        return it != entries_.end() ? it->second : 0;
    }

    /// Set the entry for a session. Entries only move forward.
    void advance(const SessionId& session, std::uint64_t seq) {
        auto& entry = entries_[session];
        if (seq > entry) entry = seq;
    }

    /// Whether op `seq` from `session` is covered.
    auto covers(const SessionId& session, std::uint64_t seq) const -> bool {
        return seq <= get(session);
    }

    /// Whether every entry of `other` is covered by this watermark.
    auto dominates(const Watermark& other) const -> bool {
        for (const auto& [session, seq] : other.entries_) {
            if (get(session) < seq) return false;
        }
        return true;
    }

    /// Pointwise minimum: what both watermarks cover.
    auto meet(const Watermark& other) const -> Watermark {
        auto result = Watermark{};
        for (const auto& [session, seq] : entries_) {
            auto m = std::min(seq, other.get(session));
            if (m > 0) result.entries_[session] = m;
        }
        return result;
    }

    /// Scalar summary: the number of ops covered.
    auto total() const -> std::uint64_t {
        auto sum = std::uint64_t{0};
        for (const auto& [session, seq] : entries_) sum += seq;
        return sum;
    }

    auto empty() const -> bool { return entries_.empty(); }

    auto entries() const -> const std::map<SessionId, std::uint64_t>& {
        return entries_;
    }

    auto operator==(const Watermark&) const -> bool = default;

private:
    std::map<SessionId, std::uint64_t> entries_;
};

}  // namespace scenesync
