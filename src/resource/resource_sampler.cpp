#include <nimbus/resource/resource_sampler.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

namespace nimbus::resource {

namespace {

// VmRSS in kB, 0 when unavailable.
std::uint64_t readRssKb() {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) {
        return 0;
    }
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line);
            std::string label;
            std::uint64_t rssKb = 0;
            iss >> label >> rssKb;
            return rssKb;
        }
    }
    return 0;
}

std::uint64_t readProcJiffies() {
    std::ifstream pstat("/proc/self/stat");
    if (!pstat.is_open()) {
        return 0;
    }
    std::string content;
    std::getline(pstat, content);
    // comm (field 2) may contain spaces; fields resume after the closing ')'
    auto rparen = content.rfind(')');
    std::string tail = (rparen != std::string::npos && rparen + 2 < content.size())
                           ? content.substr(rparen + 2)
                           : content;
    std::istringstream iss(tail);
    for (int i = 0; i < 11; ++i) {
        std::string skip;
        iss >> skip;
    }
    std::uint64_t utime = 0, stime = 0;
    iss >> utime >> stime;
    return utime + stime;
}

std::uint64_t readTotalJiffies() {
    std::ifstream sstat("/proc/stat");
    if (!sstat.is_open()) {
        return 0;
    }
    std::string cpu;
    std::getline(sstat, cpu);
    if (cpu.rfind("cpu ", 0) != 0) {
        return 0;
    }
    std::istringstream iss(cpu.substr(4));
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0,
                  steal = 0;
    iss >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    return user + nice + system + idle + iowait + irq + softirq + steal;
}

} // namespace

Result<ResourceSample> ProcResourceSampler::sample() {
    const std::uint64_t rssKb = readRssKb();
    if (rssKb == 0) {
        return Error{ErrorCode::NotSupported, "VmRSS not available from /proc/self/status"};
    }

    ResourceSample out;
    out.memoryMb = static_cast<double>(rssKb) / 1024.0;

    const std::uint64_t procJiffies = readProcJiffies();
    const std::uint64_t totalJiffies = readTotalJiffies();
    if (lastProcJiffies_ == 0 || lastTotalJiffies_ == 0 || procJiffies < lastProcJiffies_ ||
        totalJiffies < lastTotalJiffies_) {
        lastProcJiffies_ = procJiffies;
        lastTotalJiffies_ = totalJiffies;
        return out;
    }
    const std::uint64_t dProc = procJiffies - lastProcJiffies_;
    const std::uint64_t dTotal = totalJiffies - lastTotalJiffies_;
    lastProcJiffies_ = procJiffies;
    lastTotalJiffies_ = totalJiffies;
    if (dTotal > 0) {
        const double pct = (static_cast<double>(dProc) / static_cast<double>(dTotal)) * 100.0;
        out.cpuPercent = std::clamp(pct, 0.0, 100.0);
    }
    return out;
}

} // namespace nimbus::resource
