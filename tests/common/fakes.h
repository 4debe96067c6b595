#pragma once

#include <nimbus/core/types.h>
#include <nimbus/diagnostics/cloud_facts.h>
#include <nimbus/diagnostics/local_port.h>
#include <nimbus/resource/resource_sampler.h>
#include <nimbus/session/broker.h>
#include <nimbus/session/probe.h>
#include <nimbus/session/session.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <gmock/gmock.h>

namespace nimbus::test {

using nimbus::session::BrokerHandle;
using nimbus::session::ProbeSample;
using nimbus::session::Session;
using nimbus::session::SessionConfig;

// Broker that hands out "h-1", "h-2", ... and can be scripted to fail.
class FakeBroker final : public session::ISessionBroker {
public:
    Result<BrokerHandle> startSession(const SessionConfig& config) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++startCalls_;
        lastConfig_ = config;
        if (!failures_.empty()) {
            auto err = failures_.front();
            failures_.pop_front();
            return err;
        }
        return BrokerHandle{fmt::format("h-{}", ++issued_), 4000 + issued_};
    }

    Result<void> terminateSession(const BrokerHandle& handle) override {
        std::lock_guard<std::mutex> lk(mu_);
        released_.push_back(handle.id);
        return {};
    }

    void failNext(Error error, int times = 1) {
        std::lock_guard<std::mutex> lk(mu_);
        for (int i = 0; i < times; ++i) {
            failures_.push_back(error);
        }
    }

    int startCalls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return startCalls_;
    }

    std::vector<std::string> released() const {
        std::lock_guard<std::mutex> lk(mu_);
        return released_;
    }

    bool wasReleased(const std::string& handle) const {
        auto r = released();
        return std::find(r.begin(), r.end(), handle) != r.end();
    }

private:
    mutable std::mutex mu_;
    int startCalls_{0};
    int issued_{0};
    std::deque<Error> failures_;
    std::vector<std::string> released_;
    std::optional<SessionConfig> lastConfig_;
};

// Probe with a default answer and per-session overrides.
class FakeProbe final : public session::ISessionProbe {
public:
    boost::asio::awaitable<Result<ProbeSample>> probe(const Session& session) override {
        co_return next(session.id);
    }

    void setDefault(Result<ProbeSample> r) {
        std::lock_guard<std::mutex> lk(mu_);
        default_ = std::move(r);
    }

    void set(const std::string& sessionId, Result<ProbeSample> r) {
        std::lock_guard<std::mutex> lk(mu_);
        perSession_.insert_or_assign(sessionId, std::move(r));
    }

    int calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_;
    }

private:
    Result<ProbeSample> next(const std::string& id) {
        std::lock_guard<std::mutex> lk(mu_);
        ++calls_;
        if (auto it = perSession_.find(id); it != perSession_.end()) {
            return it->second;
        }
        return default_;
    }

    mutable std::mutex mu_;
    Result<ProbeSample> default_{ProbeSample{1, 0, Duration{20}}};
    std::map<std::string, Result<ProbeSample>> perSession_;
    int calls_{0};
};

// Mutable cloud facts. Every field may be replaced while checks run on
// other threads.
class FakeFacts final : public diagnostics::ICloudFactsClient {
public:
    FakeFacts() {
        agent_.registered = true;
        agent_.pingStatus = "Online";
        agent_.lastPingAge = Duration{10000};
        permissions_.granted = {"ssm:StartSession", "ssm:TerminateSession",
                                "ssm:DescribeInstanceInformation", "ec2:DescribeInstances"};
        network_.vpcId = "vpc-1";
        network_.hasInternetRoute = true;
        network_.endpointPolicyAllows = true;
        network_.routeTableAssociated = true;
        network_.httpsEgressAllowed = true;
        network_.privateDnsResolves = true;
    }

    Result<diagnostics::InstanceFacts> describeInstanceState(const std::string&) override {
        std::lock_guard<std::mutex> lk(mu_);
        ++instanceCalls_;
        if (instanceError_) {
            return *instanceError_;
        }
        return diagnostics::InstanceFacts{state_, "t3.micro", std::nullopt};
    }

    Result<diagnostics::AgentRegistration> describeAgentRegistration(const std::string&) override {
        std::function<diagnostics::AgentRegistration()> source;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++agentCalls_;
            if (agentError_) {
                return *agentError_;
            }
            if (!agentSource_) {
                return agent_;
            }
            source = agentSource_;
        }
        return source();
    }

    Result<diagnostics::PermissionFacts>
    describePermissions(const std::string&, const std::vector<std::string>&) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (permissionError_) {
            return *permissionError_;
        }
        return permissions_;
    }

    Result<diagnostics::NetworkFacts> describeNetworkConfig(const std::string&) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (networkError_) {
            return *networkError_;
        }
        return network_;
    }

    void setInstanceState(diagnostics::InstanceState s) {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = s;
    }
    void setAgent(diagnostics::AgentRegistration a) {
        std::lock_guard<std::mutex> lk(mu_);
        agent_ = std::move(a);
        agentSource_ = nullptr;
    }
    // Computed on every call, e.g. from a clock.
    void setAgentSource(std::function<diagnostics::AgentRegistration()> source) {
        std::lock_guard<std::mutex> lk(mu_);
        agentSource_ = std::move(source);
    }
    void denyPermission(const std::string& action) {
        std::lock_guard<std::mutex> lk(mu_);
        auto& g = permissions_.granted;
        g.erase(std::remove(g.begin(), g.end(), action), g.end());
        permissions_.denied.push_back(action);
    }
    void setNetwork(diagnostics::NetworkFacts n) {
        std::lock_guard<std::mutex> lk(mu_);
        network_ = std::move(n);
    }
    void failInstance(std::optional<Error> e) {
        std::lock_guard<std::mutex> lk(mu_);
        instanceError_ = std::move(e);
    }
    void failAgent(std::optional<Error> e) {
        std::lock_guard<std::mutex> lk(mu_);
        agentError_ = std::move(e);
    }
    void failPermissions(std::optional<Error> e) {
        std::lock_guard<std::mutex> lk(mu_);
        permissionError_ = std::move(e);
    }

    int instanceCalls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return instanceCalls_;
    }
    int agentCalls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return agentCalls_;
    }

    static diagnostics::AgentRegistration unregistered() { return {}; }
    static diagnostics::AgentRegistration online() {
        diagnostics::AgentRegistration a;
        a.registered = true;
        a.pingStatus = "Online";
        a.lastPingAge = Duration{5000};
        return a;
    }

private:
    mutable std::mutex mu_;
    diagnostics::InstanceState state_{diagnostics::InstanceState::Running};
    diagnostics::AgentRegistration agent_;
    std::function<diagnostics::AgentRegistration()> agentSource_;
    diagnostics::PermissionFacts permissions_;
    diagnostics::NetworkFacts network_;
    std::optional<Error> instanceError_;
    std::optional<Error> agentError_;
    std::optional<Error> permissionError_;
    std::optional<Error> networkError_;
    int instanceCalls_{0};
    int agentCalls_{0};
};

// Every port is free unless occupied or failed here.
class FakePortInspector final : public diagnostics::ILocalPortInspector {
public:
    Result<diagnostics::LocalPortStatus> inspect(std::uint16_t port) override {
        std::lock_guard<std::mutex> lk(mu_);
        inspected_.push_back(port);
        if (auto it = errors_.find(port); it != errors_.end()) {
            return it->second;
        }
        diagnostics::LocalPortStatus status;
        status.port = port;
        auto it = occupied_.find(port);
        status.available = it == occupied_.end();
        if (!status.available) {
            status.occupant = it->second;
        }
        return status;
    }

    void occupy(std::uint16_t port, std::optional<diagnostics::PortOccupant> by = std::nullopt) {
        std::lock_guard<std::mutex> lk(mu_);
        occupied_[port] = std::move(by);
    }
    void occupyRange(std::uint16_t first, std::uint16_t last) {
        for (int p = first; p <= last; ++p) {
            occupy(static_cast<std::uint16_t>(p));
        }
    }
    void fail(std::uint16_t port, Error e) {
        std::lock_guard<std::mutex> lk(mu_);
        errors_.insert_or_assign(port, std::move(e));
    }
    std::vector<std::uint16_t> inspected() const {
        std::lock_guard<std::mutex> lk(mu_);
        return inspected_;
    }

    static diagnostics::PortOccupant process(std::string name, std::uint32_t pid,
                                             bool systemCritical = false) {
        return diagnostics::PortOccupant{pid, std::move(name), systemCritical};
    }

private:
    mutable std::mutex mu_;
    std::map<std::uint16_t, std::optional<diagnostics::PortOccupant>> occupied_;
    std::map<std::uint16_t, Error> errors_;
    std::vector<std::uint16_t> inspected_;
};

class MockCloudActions : public diagnostics::ICloudActionsClient {
public:
    MOCK_METHOD(Result<void>, startInstance, (const std::string& id), (override));
    MOCK_METHOD(Result<void>, restartAgent, (const std::string& id), (override));
};

// Replays scripted samples; repeats the last one when exhausted.
class FakeSampler final : public resource::IResourceSampler {
public:
    Result<resource::ResourceSample> sample() override {
        std::lock_guard<std::mutex> lk(mu_);
        if (!error_.empty()) {
            auto e = error_.front();
            error_.pop_front();
            return e;
        }
        if (script_.size() > 1) {
            auto s = script_.front();
            script_.pop_front();
            last_ = s;
            return s;
        }
        if (!script_.empty()) {
            last_ = script_.front();
        }
        return last_;
    }

    void push(double memoryMb, double cpuPercent) {
        std::lock_guard<std::mutex> lk(mu_);
        script_.push_back(resource::ResourceSample{memoryMb, cpuPercent});
    }
    void failNext(Error e) {
        std::lock_guard<std::mutex> lk(mu_);
        error_.push_back(std::move(e));
    }

private:
    std::mutex mu_;
    std::deque<resource::ResourceSample> script_;
    std::deque<Error> error_;
    resource::ResourceSample last_{4.0, 0.1};
};

} // namespace nimbus::test
