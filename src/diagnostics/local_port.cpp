#include <nimbus/diagnostics/local_port.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::diagnostics {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kListenState = "0A";

// Socket inodes listening on `port` in one of the /proc/net/tcp tables.
std::vector<std::string> listeningInodes(const char* table, std::uint16_t port) {
    std::vector<std::string> out;
    std::ifstream in(table);
    if (!in.is_open()) {
        return out;
    }
    std::string line;
    std::getline(in, line); // header
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string slot, local, remote, state, queues, timer, retransmits, uid, timeout, inode;
        iss >> slot >> local >> remote >> state >> queues >> timer >> retransmits >> uid >>
            timeout >> inode;
        if (state != kListenState || inode.empty() || inode == "0") {
            continue;
        }
        auto colon = local.rfind(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto localPort = std::strtoul(local.c_str() + colon + 1, nullptr, 16);
        if (localPort == port) {
            out.push_back(inode);
        }
    }
    return out;
}

std::string readComm(const fs::path& procDir) {
    std::ifstream comm(procDir / "comm");
    std::string name;
    if (comm.is_open()) {
        std::getline(comm, name);
    }
    return name;
}

// Walks /proc/<pid>/fd looking for a link to one of `inodes`. Processes we
// may not inspect are skipped.
std::optional<PortOccupant> findOccupant(const std::vector<std::string>& inodes) {
    std::vector<std::string> targets;
    targets.reserve(inodes.size());
    for (const auto& inode : inodes) {
        targets.push_back(fmt::format("socket:[{}]", inode));
    }

    std::error_code ec;
    for (fs::directory_iterator proc("/proc", ec), end; !ec && proc != end; proc.increment(ec)) {
        const auto pidText = proc->path().filename().string();
        if (pidText.empty() ||
            !std::all_of(pidText.begin(), pidText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            continue;
        }
        std::error_code fdEc;
        for (fs::directory_iterator fd(proc->path() / "fd", fdEc), fdEnd;
             !fdEc && fd != fdEnd; fd.increment(fdEc)) {
            std::error_code linkEc;
            const auto link = fs::read_symlink(fd->path(), linkEc).string();
            if (linkEc || std::find(targets.begin(), targets.end(), link) == targets.end()) {
                continue;
            }
            PortOccupant occupant;
            occupant.pid = static_cast<std::uint32_t>(std::strtoul(pidText.c_str(), nullptr, 10));
            occupant.processName = readComm(proc->path());
            occupant.systemCritical = isSystemCriticalProcess(occupant.processName);
            return occupant;
        }
    }
    return std::nullopt;
}

} // namespace

bool isSystemCriticalProcess(std::string_view name) {
    static constexpr std::array<std::string_view, 8> kCritical = {
        "sshd", "systemd", "init", "kernel", "launchd", "kthreadd", "dbus-daemon", "containerd"};
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(kCritical.begin(), kCritical.end(), [&](std::string_view critical) {
        return lowered.find(critical) != std::string::npos;
    });
}

Result<LocalPortStatus> SystemPortInspector::inspect(std::uint16_t port) {
    if (port == 0) {
        return Error{ErrorCode::InvalidArgument, "local port 0 is not a forwarding port"};
    }
    LocalPortStatus status;
    status.port = port;

    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(io);
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), port);
    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return Error{ErrorCode::InternalError, fmt::format("cannot open socket: {}", ec.message())};
    }
    acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    acceptor.bind(endpoint, ec);
    if (!ec) {
        status.available = true;
        return status;
    }
    if (ec != boost::asio::error::address_in_use && ec != boost::asio::error::access_denied) {
        return Error{ErrorCode::InternalError,
                     fmt::format("cannot bind 127.0.0.1:{}: {}", port, ec.message())};
    }

    auto inodes = listeningInodes("/proc/net/tcp", port);
    auto inodes6 = listeningInodes("/proc/net/tcp6", port);
    inodes.insert(inodes.end(), inodes6.begin(), inodes6.end());
    if (!inodes.empty()) {
        status.occupant = findOccupant(inodes);
    }
    spdlog::debug("[LocalPort] {} in use ({})", port,
                  status.occupant ? status.occupant->processName : std::string("holder unknown"));
    return status;
}

std::vector<std::uint16_t> suggestAlternativePorts(ILocalPortInspector& inspector,
                                                   std::uint16_t port, std::uint16_t range,
                                                   std::size_t limit) {
    std::vector<std::uint16_t> out;
    for (int distance = 1; distance <= range && out.size() < limit; ++distance) {
        for (int candidate : {port - distance, port + distance}) {
            if (candidate < 1 || candidate > 65535 || out.size() >= limit) {
                continue;
            }
            auto res = inspector.inspect(static_cast<std::uint16_t>(candidate));
            if (res && res.value().available) {
                out.push_back(static_cast<std::uint16_t>(candidate));
            }
        }
    }
    return out;
}

} // namespace nimbus::diagnostics
