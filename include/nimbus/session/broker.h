#pragma once

#include <nimbus/core/types.h>
#include <nimbus/session/session.h>

namespace nimbus::session {

// Boundary to the external session-broker process that owns the actual
// tunnel. Calls are synchronous; implementations report transient failures
// as TransientNetworkError and credential problems as AuthorizationError.
class ISessionBroker {
public:
    virtual ~ISessionBroker() = default;

    virtual Result<BrokerHandle> startSession(const SessionConfig& config) = 0;
    virtual Result<void> terminateSession(const BrokerHandle& handle) = 0;
};

} // namespace nimbus::session
