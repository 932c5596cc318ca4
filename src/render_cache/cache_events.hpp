#pragma once
#include "types.hpp"
#include <vector>
#include <mutex>
#include <cstdint>

namespace docserve {

// Subscriber list for InvalidationEvents.
class CacheEventBus {
public:
    // Returns a subscription ID.
    uint64_t subscribe(CacheEventListener listener);

    // Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Call every listener synchronously in registration order. The mutex is
    // released before calling, so listeners may call back into the cache.
    // A listener that throws is logged and skipped; the rest still run.
    void publish(const InvalidationEvent& event);

    void clear();

    size_t subscriber_count() const;

private:
    struct Subscription {
        uint64_t id;
        CacheEventListener listener;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

} // namespace docserve
