#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "util/ThrottledProgress.hpp"

using namespace evidhash;
using namespace std::chrono_literals;

namespace {
struct Recorder {
    std::vector<std::pair<int, std::string>> calls;
    ProgressCallback callback() {
        return [this](int p, const std::string& m) { calls.emplace_back(p, m); };
    }
};
}

// Test: 0% and 100% are always delivered immediately
TEST(ThrottledProgressTest, BoundariesAlwaysDelivered) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 10s);
    progress.report(0, "start");
    progress.report(100, "done");
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(rec.calls[0].first, 0);
    EXPECT_EQ(rec.calls[1].first, 100);
    EXPECT_EQ(rec.calls[1].second, "done");
}

// Test: Updates inside the interval are held back and flushed later
TEST(ThrottledProgressTest, ThrottlesWithinInterval) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 10s);
    progress.report(10, "a");   // first update is due immediately
    progress.report(20, "b");
    progress.report(30, "c");
    ASSERT_EQ(rec.calls.size(), 1u);
    EXPECT_EQ(rec.calls[0].first, 10);

    progress.flushPending();
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(rec.calls[1].first, 30);
    EXPECT_EQ(rec.calls[1].second, "c");

    // Nothing pending any more
    progress.flushPending();
    EXPECT_EQ(rec.calls.size(), 2u);
}

// Test: Once the interval has passed a changed value goes through
TEST(ThrottledProgressTest, DeliversAfterInterval) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 20ms);
    progress.report(10, "a");
    std::this_thread::sleep_for(40ms);
    progress.report(20, "b");
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(progress.lastDelivered(), 20);
}

// Test: The same percentage is not delivered twice
TEST(ThrottledProgressTest, SuppressesDuplicates) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 0ms);
    progress.report(50, "x");
    progress.report(50, "y");
    EXPECT_EQ(rec.calls.size(), 1u);
}

// Test: A throwing callback is contained
TEST(ThrottledProgressTest, CallbackExceptionContained) {
    int calls = 0;
    ThrottledProgress progress([&calls](int, const std::string&) {
        ++calls;
        throw std::runtime_error("ui gone");
    }, 0ms);
    EXPECT_NO_THROW(progress.report(0, "start"));
    EXPECT_NO_THROW(progress.report(100, "done"));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(progress.lastDelivered(), 100);
}

// Test: An empty callback is allowed
TEST(ThrottledProgressTest, EmptyCallback) {
    ThrottledProgress progress(ProgressCallback{}, 0ms);
    EXPECT_NO_THROW(progress.report(42, "x"));
    EXPECT_EQ(progress.lastDelivered(), 42);
}

// Test: reset() clears the delivery history
TEST(ThrottledProgressTest, ResetClearsHistory) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 10s);
    progress.report(40, "a");
    progress.reset();
    EXPECT_EQ(progress.lastDelivered(), -1);
    progress.report(40, "a");
    EXPECT_EQ(rec.calls.size(), 2u);
}

// Test: A value lower than one already delivered is dropped
TEST(ThrottledProgressTest, NeverGoesBackwards) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 0ms);
    progress.report(0, "start");
    progress.report(60, "b");
    progress.report(40, "a");   // raced in late
    progress.report(0, "late zero");
    progress.report(100, "done");
    ASSERT_EQ(rec.calls.size(), 3u);
    EXPECT_EQ(rec.calls[1].first, 60);
    EXPECT_EQ(rec.calls[2].first, 100);
}

// Test: Nothing is delivered after close()
TEST(ThrottledProgressTest, CloseStopsDelivery) {
    Recorder rec;
    ThrottledProgress progress(rec.callback(), 10s);
    progress.report(10, "a");
    progress.report(20, "b");   // pending
    progress.close();
    progress.flushPending();
    progress.report(100, "done");
    ASSERT_EQ(rec.calls.size(), 1u);
    EXPECT_EQ(rec.calls[0].first, 10);
}
