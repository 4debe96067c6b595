#include <nimbus/session/session_store.h>

#include <algorithm>

namespace nimbus::session {

Result<void> InMemorySessionStore::saveSession(const Session& session) {
    if (session.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "session id is empty"};
    }
    std::lock_guard<std::mutex> lk(mu_);
    sessions_[session.id] = session;
    ++saves_;
    return {};
}

Result<std::optional<Session>> InMemorySessionStore::loadSession(const SessionId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::optional<Session>{};
    }
    return std::optional<Session>{it->second};
}

Result<void> InMemorySessionStore::deleteSession(const SessionId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(id);
    metrics_.erase(id);
    return {};
}

Result<void> InMemorySessionStore::saveMetrics(const SessionMetrics& metrics) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& series = metrics_[metrics.sessionId];
    series.push_back(metrics);
    if (series.size() > metricsPerSession_) {
        series.erase(series.begin(),
                     series.begin() + static_cast<std::ptrdiff_t>(series.size() -
                                                                  metricsPerSession_));
    }
    return {};
}

Result<std::vector<SessionMetrics>> InMemorySessionStore::loadMetrics(const SessionId& id,
                                                                      std::size_t limit) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = metrics_.find(id);
    if (it == metrics_.end()) {
        return std::vector<SessionMetrics>{};
    }
    const auto& series = it->second;
    const std::size_t n = limit == 0 ? series.size() : std::min(limit, series.size());
    // Most recent first.
    return std::vector<SessionMetrics>(series.rbegin(),
                                       series.rbegin() + static_cast<std::ptrdiff_t>(n));
}

std::size_t InMemorySessionStore::sessionCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

std::size_t InMemorySessionStore::saveCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return saves_;
}

} // namespace nimbus::session
