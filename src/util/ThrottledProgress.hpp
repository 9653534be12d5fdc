#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace evidhash {

using ProgressCallback = std::function<void(int percent, const std::string& message)>;

/**
 * @brief Rate-limited, thread-safe wrapper around a progress callback
 *
 * Many workers finishing small files would otherwise flood the consumer.
 * Rules:
 *   - delivered percentages never decrease; a lower value arriving late
 *     (reporters race each other) is dropped
 *   - 0% and 100% are delivered immediately
 *   - otherwise at most one delivery per interval, and only when the
 *     percentage changed
 *   - a suppressed update is kept as pending and delivered by flushPending()
 *   - an exception thrown by the callback is logged, never propagated
 *   - after close() nothing is delivered; close() returns only once a
 *     delivery in progress on another thread has finished
 */
class ThrottledProgress {
public:
    using Clock = std::chrono::steady_clock;

    ThrottledProgress(ProgressCallback callback, std::chrono::milliseconds interval);

    void report(int percent, const std::string& message);
    void flushPending();
    void close();
    void reset();

    int lastDelivered() const;

private:
    void deliver(int percent, const std::string& message, Clock::time_point now);

    ProgressCallback callback;
    std::chrono::milliseconds interval;
    mutable std::mutex mtx;
    Clock::time_point lastTime{};
    bool anyDelivered{false};
    bool closed{false};
    int lastPercent{-1};
    std::optional<std::pair<int, std::string>> pending;
};

}
