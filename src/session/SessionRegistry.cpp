#include <nimbus/session/SessionRegistry.h>

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace nimbus::session {

Session& SessionRegistry::insert(Session session) {
    if (session.id.empty()) {
        throw std::logic_error("SessionRegistry: cannot insert a session without an id");
    }
    const SessionId id = session.id;
    const TargetId target = session.targetId();
    auto [it, inserted] = arena_.emplace(id, std::move(session));
    if (!inserted) {
        throw std::logic_error(fmt::format("SessionRegistry: duplicate session id {}", id));
    }
    byTarget_[target].push_back(id);
    return it->second;
}

bool SessionRegistry::erase(const SessionId& id) {
    auto it = arena_.find(id);
    if (it == arena_.end()) {
        return false;
    }
    auto idx = byTarget_.find(it->second.targetId());
    if (idx == byTarget_.end()) {
        throw std::logic_error(
            fmt::format("SessionRegistry: session {} missing from target index", id));
    }
    auto& ids = idx->second;
    auto pos = std::find(ids.begin(), ids.end(), id);
    if (pos == ids.end()) {
        throw std::logic_error(
            fmt::format("SessionRegistry: session {} missing from target index", id));
    }
    ids.erase(pos);
    if (ids.empty()) {
        byTarget_.erase(idx);
    }
    arena_.erase(it);
    return true;
}

Session* SessionRegistry::find(const SessionId& id) {
    auto it = arena_.find(id);
    return it == arena_.end() ? nullptr : &it->second;
}

const Session* SessionRegistry::find(const SessionId& id) const {
    auto it = arena_.find(id);
    return it == arena_.end() ? nullptr : &it->second;
}

Session& SessionRegistry::at(const SessionId& id) {
    auto* s = find(id);
    if (!s) {
        throw std::logic_error(fmt::format("SessionRegistry: unknown session id {}", id));
    }
    return *s;
}

std::vector<const Session*> SessionRegistry::forTarget(const TargetId& target) const {
    std::vector<const Session*> out;
    auto idx = byTarget_.find(target);
    if (idx == byTarget_.end()) {
        return out;
    }
    out.reserve(idx->second.size());
    for (const auto& id : idx->second) {
        const auto* s = find(id);
        if (!s) {
            throw std::logic_error(
                fmt::format("SessionRegistry: index references missing session {}", id));
        }
        out.push_back(s);
    }
    return out;
}

std::vector<const Session*> SessionRegistry::all() const {
    std::vector<const Session*> out;
    out.reserve(arena_.size());
    for (const auto& [id, s] : arena_) {
        out.push_back(&s);
    }
    return out;
}

std::size_t SessionRegistry::occupied() const {
    return static_cast<std::size_t>(std::count_if(arena_.begin(), arena_.end(), [](const auto& kv) {
        return kv.second.status != SessionStatus::Terminated;
    }));
}

std::size_t SessionRegistry::occupied(const TargetId& target) const {
    const auto sessions = forTarget(target);
    return static_cast<std::size_t>(std::count_if(sessions.begin(), sessions.end(), [](auto* s) {
        return s->status != SessionStatus::Terminated;
    }));
}

std::optional<SessionId>
SessionRegistry::evictionCandidate(const std::optional<TargetId>& target,
                                   const std::vector<SessionId>& exclude) const {
    const auto pool = target ? forTarget(*target) : all();
    const Session* best = nullptr;
    for (const auto* s : pool) {
        if (s->status != SessionStatus::Inactive ||
            std::find(exclude.begin(), exclude.end(), s->id) != exclude.end()) {
            continue;
        }
        if (!best || s->priority() < best->priority() ||
            (s->priority() == best->priority() && s->lastActivity < best->lastActivity) ||
            (s->priority() == best->priority() && s->lastActivity == best->lastActivity &&
             s->id < best->id)) {
            best = s;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->id;
}

} // namespace nimbus::session
