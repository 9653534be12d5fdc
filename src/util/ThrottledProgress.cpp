#include "util/ThrottledProgress.hpp"

#include <exception>

#include "util/Logger.hpp"

namespace evidhash {

ThrottledProgress::ThrottledProgress(ProgressCallback cb, std::chrono::milliseconds iv)
    : callback(std::move(cb)), interval(iv) {}

void ThrottledProgress::report(int percent, const std::string& message) {
    std::scoped_lock lock(mtx);
    if (closed) return;
    if (anyDelivered && percent < lastPercent) return;
    auto now = Clock::now();

    if (percent == 0 || percent == 100) {
        deliver(percent, message, now);
        return;
    }

    bool due = !anyDelivered || (now - lastTime) >= interval;
    if (due && percent != lastPercent) {
        deliver(percent, message, now);
    } else if (!pending || percent >= pending->first) {
        pending = std::make_pair(percent, message);
    }
}

void ThrottledProgress::flushPending() {
    std::scoped_lock lock(mtx);
    if (closed) return;
    if (pending) {
        auto [percent, message] = *pending;
        deliver(percent, message, Clock::now());
    }
}

void ThrottledProgress::close() {
    std::scoped_lock lock(mtx);
    closed = true;
    pending.reset();
}

void ThrottledProgress::reset() {
    std::scoped_lock lock(mtx);
    closed = false;
    lastTime = Clock::time_point{};
    anyDelivered = false;
    lastPercent = -1;
    pending.reset();
}

int ThrottledProgress::lastDelivered() const {
    std::scoped_lock lock(mtx);
    return lastPercent;
}

// Caller holds mtx; deliveries are therefore serialized and ordered
void ThrottledProgress::deliver(int percent, const std::string& message, Clock::time_point now) {
    pending.reset();
    lastTime = now;
    anyDelivered = true;
    lastPercent = percent;
    if (!callback) return;
    try {
        callback(percent, message);
    } catch (const std::exception& e) {
        Logger::instance().warn(std::string("progress callback threw: ") + e.what());
    }
}

}
