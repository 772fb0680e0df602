#include <gtest/gtest.h>

#include "error_envelope.hpp"
#include "logger.hpp"
#include "throttler.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace autobridge;
using namespace std::chrono_literals;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return condition();
}

/// Records the order in which queued callers got their slot.
class AdmissionLog {
public:
    void record(int caller) {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(caller);
    }

    std::vector<int> order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    size_t size() const { return order().size(); }

private:
    mutable std::mutex mutex_;
    std::vector<int> order_;
};

} // namespace

TEST(RequestThrottler, AdmitsUpToLimitWithoutWaiting) {
    RequestThrottler throttler(3);

    throttler.acquire();
    throttler.acquire();
    throttler.acquire();

    EXPECT_EQ(throttler.in_flight(), 3u);
    EXPECT_EQ(throttler.waiting(), 0u);

    throttler.release();
    EXPECT_EQ(throttler.in_flight(), 2u);
}

TEST(RequestThrottler, ZeroLimitStillAdmitsOne) {
    RequestThrottler throttler(0);

    EXPECT_EQ(throttler.max_concurrent(), 1u);
    throttler.acquire();
    EXPECT_EQ(throttler.in_flight(), 1u);
}

TEST(RequestThrottler, ThirdCallerWaitsForRelease) {
    RequestThrottler throttler(2);
    throttler.acquire();
    throttler.acquire();

    std::atomic<bool> admitted{false};
    std::thread third([&]() {
        throttler.acquire();
        admitted = true;
    });

    ASSERT_TRUE(eventually([&]() { return throttler.waiting() == 1; }));
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(admitted);
    EXPECT_EQ(throttler.in_flight(), 2u);

    throttler.release();
    ASSERT_TRUE(eventually([&]() { return admitted.load(); }));
    EXPECT_EQ(throttler.in_flight(), 2u);
    EXPECT_EQ(throttler.waiting(), 0u);

    third.join();
}

TEST(RequestThrottler, QueuedCallersAreAdmittedInArrivalOrder) {
    RequestThrottler throttler(1);
    throttler.acquire();

    AdmissionLog log;
    std::vector<std::thread> callers;
    for (int caller = 0; caller < 3; ++caller) {
        callers.emplace_back([&throttler, &log, caller]() {
            throttler.acquire();
            log.record(caller);
        });
        ASSERT_TRUE(eventually([&]() { return throttler.waiting() == static_cast<size_t>(caller + 1); }));
    }

    for (size_t admitted = 1; admitted <= 3; ++admitted) {
        throttler.release();
        ASSERT_TRUE(eventually([&]() { return log.size() == admitted; }));
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(log.order(), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(throttler.in_flight(), 1u);
}

TEST(RequestThrottler, CancelledWaiterLeavesQueueInOrder) {
    RequestThrottler throttler(1);
    throttler.acquire();

    AdmissionLog log;
    std::atomic<bool> cancel_middle{false};
    std::atomic<bool> middle_cancelled{false};

    std::thread first([&]() {
        throttler.acquire();
        log.record(0);
    });
    ASSERT_TRUE(eventually([&]() { return throttler.waiting() == 1; }));

    std::thread middle([&]() {
        try {
            throttler.acquire([&]() { return cancel_middle.load(); });
            log.record(1);
        } catch (const OperationCancelled&) {
            middle_cancelled = true;
        }
    });
    ASSERT_TRUE(eventually([&]() { return throttler.waiting() == 2; }));

    std::thread last([&]() {
        throttler.acquire();
        log.record(2);
    });
    ASSERT_TRUE(eventually([&]() { return throttler.waiting() == 3; }));

    cancel_middle = true;
    ASSERT_TRUE(eventually([&]() { return middle_cancelled.load(); }));
    EXPECT_EQ(throttler.waiting(), 2u);
    EXPECT_EQ(throttler.in_flight(), 1u);

    throttler.release();
    ASSERT_TRUE(eventually([&]() { return log.size() == 1; }));
    throttler.release();
    ASSERT_TRUE(eventually([&]() { return log.size() == 2; }));

    first.join();
    middle.join();
    last.join();

    EXPECT_EQ(log.order(), (std::vector<int>{0, 2}));
}

TEST(RequestThrottler, CancelBeforeWaitingThrowsOnlyWhenQueued) {
    RequestThrottler throttler(1);

    // A free slot is taken even if the caller would cancel.
    throttler.acquire([]() { return true; });
    EXPECT_EQ(throttler.in_flight(), 1u);

    EXPECT_THROW(throttler.acquire([]() { return true; }), OperationCancelled);
    EXPECT_EQ(throttler.waiting(), 0u);
    EXPECT_EQ(throttler.in_flight(), 1u);
}

TEST(RequestThrottler, PermitReleasesOnScopeExit) {
    RequestThrottler throttler(2);
    {
        RequestThrottler::Permit permit = throttler.admit();
        EXPECT_TRUE(permit.held());
        EXPECT_EQ(throttler.in_flight(), 1u);

        RequestThrottler::Permit moved = std::move(permit);
        EXPECT_FALSE(permit.held());
        EXPECT_TRUE(moved.held());
        EXPECT_EQ(throttler.in_flight(), 1u);
    }
    EXPECT_EQ(throttler.in_flight(), 0u);

    RequestThrottler::Permit early = throttler.admit();
    early.reset();
    EXPECT_FALSE(early.held());
    EXPECT_EQ(throttler.in_flight(), 0u);
}
