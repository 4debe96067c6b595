#pragma once

#include <nimbus/session/session.h>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace nimbus::session {

// Arena of Session values keyed by id, plus a per-target index.
// Not thread-safe: SessionManager serializes every access.
//
// The index and the arena must agree at all times. A mismatch is a
// programming error and surfaces as std::logic_error rather than a Result.
class SessionRegistry {
public:
    Session& insert(Session session);
    bool erase(const SessionId& id);

    Session* find(const SessionId& id);
    const Session* find(const SessionId& id) const;

    // Throws std::logic_error when the id is unknown.
    Session& at(const SessionId& id);

    std::vector<const Session*> forTarget(const TargetId& target) const;
    std::vector<const Session*> all() const;

    // Sessions holding a slot (every status except Terminated).
    std::size_t occupied() const;
    std::size_t occupied(const TargetId& target) const;

    // Eviction candidate: lowest priority, then longest idle, among Inactive
    // sessions not in `exclude`. Restricted to `target` when given.
    std::optional<SessionId> evictionCandidate(const std::optional<TargetId>& target,
                                               const std::vector<SessionId>& exclude = {}) const;

    std::size_t size() const noexcept { return arena_.size(); }
    bool empty() const noexcept { return arena_.empty(); }

private:
    std::unordered_map<SessionId, Session> arena_;
    std::unordered_map<TargetId, std::vector<SessionId>> byTarget_;
};

} // namespace nimbus::session
