#pragma once

#include <atomic>
#include <cstddef>

#include "metrics.hpp"

namespace passgen {

// Counts open sessions and enforces the global connection ceiling.
class ConnectionTracker {
public:
    ConnectionTracker() = default;

    ConnectionTracker(const ConnectionTracker&) = delete;
    ConnectionTracker& operator=(const ConnectionTracker&) = delete;

    // Reserves a slot unless `limit` sessions are already open.
    bool try_acquire(size_t limit) {
        size_t current = count_.load();
        while (current < limit) {
            if (count_.compare_exchange_weak(current, current + 1)) {
                MetricsRegistry::instance().increment_gauge(metric::ACTIVE_CONNECTIONS);
                return true;
            }
        }
        return false;
    }

    void release() {
        count_.fetch_sub(1);
        MetricsRegistry::instance().decrement_gauge(metric::ACTIVE_CONNECTIONS);
    }

    size_t count() const {
        return count_.load();
    }

private:
    std::atomic<size_t> count_{0};
};

}
