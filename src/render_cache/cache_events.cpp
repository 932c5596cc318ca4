#include "cache_events.hpp"

#include <exception>
#include <iostream>

namespace docserve {

uint64_t CacheEventBus::subscribe(CacheEventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subscriptions_.push_back(Subscription{id, std::move(listener)});
    return id;
}

bool CacheEventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
        if (it->id == id) {
            subscriptions_.erase(it);
            return true;
        }
    }
    return false;
}

void CacheEventBus::publish(const InvalidationEvent& event) {
    // Copy listeners out under lock, then call without lock held.
    std::vector<CacheEventListener> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscriptions_.empty()) return;
        to_call.reserve(subscriptions_.size());
        for (const auto& sub : subscriptions_) {
            to_call.push_back(sub.listener);
        }
    }
    for (const auto& listener : to_call) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "[cache] Listener failed on " << reason_name(event.reason)
                      << " event: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[cache] Listener failed on " << reason_name(event.reason)
                      << " event: unknown exception\n";
        }
    }
}

void CacheEventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

size_t CacheEventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace docserve
