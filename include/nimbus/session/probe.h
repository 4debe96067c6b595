#pragma once

#include <nimbus/core/types.h>
#include <nimbus/session/session.h>

#include <cstdint>

#include <utility>
#include <boost/asio/awaitable.hpp>

namespace nimbus::session {

struct ProbeSample {
    std::uint32_t connectionCount{0};
    std::uint64_t bytesTransferred{0};
    Duration latency{0};
};

// Heartbeat against a live session (local port forwarder plus broker
// process). A network round-trip, so it suspends the caller.
class ISessionProbe {
public:
    virtual ~ISessionProbe() = default;
    virtual boost::asio::awaitable<Result<ProbeSample>> probe(const Session& session) = 0;
};

} // namespace nimbus::session
