#pragma once

#include <nimbus/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::diagnostics {

struct PortOccupant {
    std::optional<std::uint32_t> pid;
    std::string processName;
    bool systemCritical{false};
};

struct LocalPortStatus {
    std::uint16_t port{0};
    bool available{false};
    // Set when the port is taken and the holder could be identified.
    std::optional<PortOccupant> occupant;
};

// Answers whether a local TCP port can be bound for forwarding.
class ILocalPortInspector {
public:
    virtual ~ILocalPortInspector() = default;
    virtual Result<LocalPortStatus> inspect(std::uint16_t port) = 0;
};

// Binds 127.0.0.1:<port> to test availability. When the bind fails with
// EADDRINUSE the holder is looked up through the listening sockets in
// /proc/net/tcp{,6} and the socket links under /proc/<pid>/fd.
class SystemPortInspector final : public ILocalPortInspector {
public:
    Result<LocalPortStatus> inspect(std::uint16_t port) override;
};

// sshd, systemd, init and the like; freeing their port is not an option.
bool isSystemCriticalProcess(std::string_view name);

// Free ports within `range` of `port`, nearest first, at most `limit`.
// Ports that cannot be inspected are skipped.
std::vector<std::uint16_t> suggestAlternativePorts(ILocalPortInspector& inspector,
                                                   std::uint16_t port, std::uint16_t range,
                                                   std::size_t limit);

} // namespace nimbus::diagnostics
