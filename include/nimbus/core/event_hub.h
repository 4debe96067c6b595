#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace nimbus {

// Typed observer list. publish() snapshots the subscriber list and invokes
// every handler synchronously on the publishing thread without holding the
// lock, so handlers may subscribe/unsubscribe re-entrantly. Handlers must not
// block. Delivery is at-least-once from the consumer's point of view: the
// same logical event may be published again after a retry, so consumers are
// expected to be idempotent.
template <typename T> class EventHub {
public:
    using Handler = std::function<void(const T&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto id = ++nextId_;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void publish(const T& event) const {
        std::vector<std::pair<SubscriptionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lk(mu_);
            snapshot = handlers_;
        }
        for (const auto& [id, handler] : snapshot) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                spdlog::warn("[EventHub] subscriber {} threw: {}", id, e.what());
            }
        }
    }

    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return handlers_.size();
    }

private:
    mutable std::mutex mu_;
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    SubscriptionId nextId_{0};
};

} // namespace nimbus
