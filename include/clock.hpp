#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace passgen {

// Source of wall-clock time in whole Unix-epoch seconds.
// Injected into the deriver and the health handler so tests can pin the timestamp.
class Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t now_epoch_seconds() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_epoch_seconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// Returns a settable constant. Used by tests and by passgen_derive --timestamp.
class FixedClock : public Clock {
public:
    explicit FixedClock(int64_t epoch_seconds) : epoch_seconds_(epoch_seconds) {}

    int64_t now_epoch_seconds() const override {
        return epoch_seconds_.load();
    }

    void set(int64_t epoch_seconds) {
        epoch_seconds_.store(epoch_seconds);
    }

private:
    std::atomic<int64_t> epoch_seconds_;
};

}
