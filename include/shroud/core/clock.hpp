// include/shroud/core/clock.hpp

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace shroud {

/**
 * @brief Source of "now" for staleness and expiry decisions
 *
 * Components hold a reference and never own the clock. Implementations
 * must be safe for concurrent reads.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current time in epoch milliseconds
     */
    virtual int64_t now_ms() const = 0;

    /**
     * @brief Current time in epoch seconds
     */
    int64_t now_seconds() const {
        return now_ms() / 1000;
    }
};

/**
 * @brief Wall-clock implementation backed by std::chrono::system_clock
 */
class SystemClock final : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

/**
 * @brief Manually driven clock for tests and replays
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_ms_(start_ms) {}

    int64_t now_ms() const override {
        return now_ms_.load();
    }

    void set_ms(int64_t value) {
        now_ms_.store(value);
    }

    void advance_ms(int64_t delta) {
        now_ms_.fetch_add(delta);
    }

private:
    std::atomic<int64_t> now_ms_;
};

}  // namespace shroud
