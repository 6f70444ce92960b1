#include "openxfer/AdmissionController.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace openxfer;
using namespace std::chrono_literals;

namespace {

const std::string kSmb = "smb://10.0.0.5:445";

TransferResult timedOut() {
    return TransferResult::failure(ErrorKind::NetworkError, "read timed out", {}, true);
}

void runTimes(AdmissionController& ac, Protocol p, const std::string& key, int n, TransferResult (*op)()) {
    for (int i = 0; i < n; ++i) ac.withThrottle(p, key, false, op);
}

TransferResult ok() {
    return TransferResult::success("x");
}

// Runs a low-priority call that gives up waiting for a permit after `wait`.
bool runsWithin(AdmissionController& ac, const std::string& key, std::chrono::milliseconds wait) {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    bool ran = false;
    try {
        ac.withThrottle(Protocol::Smb, key, false, [&] {
            ran = true;
            return 0;
        }, [&] { return std::chrono::steady_clock::now() > deadline; });
    } catch (const CancelledError&) {
    }
    return ran;
}

} // namespace

TEST(AdmissionController, DegradesAfterThreeTimeoutsAndRestoresAfterTenSuccesses) {
    AdmissionController ac;
    runTimes(ac, Protocol::Smb, kSmb, 1, ok);
    EXPECT_EQ(ac.currentLimit(kSmb), 2);
    EXPECT_FALSE(ac.isDegraded(kSmb));

    runTimes(ac, Protocol::Smb, kSmb, 2, timedOut);
    EXPECT_EQ(ac.currentLimit(kSmb), 2);
    runTimes(ac, Protocol::Smb, kSmb, 1, timedOut);
    EXPECT_EQ(ac.currentLimit(kSmb), 1);
    EXPECT_TRUE(ac.isDegraded(kSmb));
    EXPECT_EQ(ac.snapshot(kSmb)->consecutiveTimeouts, 0);

    runTimes(ac, Protocol::Smb, kSmb, 9, ok);
    EXPECT_EQ(ac.currentLimit(kSmb), 1);
    runTimes(ac, Protocol::Smb, kSmb, 1, ok);
    EXPECT_EQ(ac.currentLimit(kSmb), 2);
    EXPECT_FALSE(ac.isDegraded(kSmb));
    EXPECT_EQ(ac.snapshot(kSmb)->consecutiveSuccesses, 0);
}

TEST(AdmissionController, DegradedLimitIsEnforced) {
    AdmissionController ac;
    runTimes(ac, Protocol::Smb, kSmb, 3, timedOut);
    ASSERT_EQ(ac.currentLimit(kSmb), 1);

    std::atomic<bool> second{false};
    std::thread waiter;
    ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
        waiter = std::thread([&] {
            ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
                second = true;
                return 0;
            });
        });
        std::this_thread::sleep_for(200ms);
        EXPECT_FALSE(second.load());
        return 0;
    });
    waiter.join();
    EXPECT_TRUE(second.load());
    EXPECT_EQ(ac.activeTaskCount(kSmb), 0);
}

TEST(AdmissionController, CapacityChangeWaitsForInFlightTasks) {
    AdmissionController ac;
    ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
        // High-priority calls degrade the endpoint while this one holds a permit.
        for (int i = 0; i < 3; ++i) ac.withThrottle(Protocol::Smb, kSmb, true, timedOut);
        EXPECT_EQ(ac.currentLimit(kSmb), 1);
        // The old capacity of 2 still applies.
        EXPECT_TRUE(runsWithin(ac, kSmb, 1s));
        return 0;
    });
    EXPECT_EQ(ac.activeTaskCount(kSmb), 0);

    // Idle now, so the next call rebuilds with a single permit.
    ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
        EXPECT_FALSE(runsWithin(ac, kSmb, 300ms));
        return 0;
    });
    EXPECT_TRUE(runsWithin(ac, kSmb, 1s));
}

TEST(AdmissionController, LimitStaysWithinBounds) {
    AdmissionController ac;
    runTimes(ac, Protocol::Smb, kSmb, 30, timedOut);
    auto s = ac.snapshot(kSmb);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->currentLimit, s->minLimit);

    runTimes(ac, Protocol::Smb, kSmb, 100, ok);
    s = ac.snapshot(kSmb);
    EXPECT_EQ(s->currentLimit, s->maxLimit);
    EXPECT_GE(s->currentLimit, s->minLimit);
}

TEST(AdmissionController, PlainFailuresDoNotDegrade) {
    AdmissionController ac;
    for (int i = 0; i < 5; ++i)
        ac.withThrottle(Protocol::Ftp, "ftp://h:21", false,
                        [] { return TransferResult::failure(ErrorKind::FileNotFound, "gone"); });
    EXPECT_EQ(ac.currentLimit("ftp://h:21"), 2);
    EXPECT_FALSE(ac.isDegraded("ftp://h:21"));
}

TEST(AdmissionController, TimeoutExceptionsCountAndPropagate) {
    AdmissionController ac;
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(ac.withThrottle(Protocol::Smb, kSmb, false, []() -> int { throw TimeoutError("stalled"); }),
                     TimeoutError);
    }
    EXPECT_TRUE(ac.isDegraded(kSmb));
    EXPECT_EQ(ac.ioTuning(kSmb).timeout, AdmissionController::kDegradedTimeout);
}

TEST(AdmissionController, HighPriorityRunsWithoutFreePermits) {
    AdmissionController ac;
    bool ran = false;
    ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
        return ac.withThrottle(Protocol::Smb, kSmb, false, [&] {
            // Both permits are held here.
            return ac.withThrottle(Protocol::Smb, kSmb, true, [&] {
                ran = true;
                EXPECT_EQ(ac.activeTaskCount(kSmb), 3);
                return 0;
            });
        });
    });
    EXPECT_TRUE(ran);
    EXPECT_EQ(ac.activeTaskCount(kSmb), 0);
}

TEST(AdmissionController, ExclusiveModeRefusesBackgroundCalls) {
    AdmissionController ac;
    ac.activateExclusiveMode(kSmb);
    EXPECT_TRUE(ac.isExclusiveModeActive(kSmb));
    EXPECT_THROW(ac.withThrottle(Protocol::Smb, kSmb, false, [] { return 0; }), CancelledError);
    EXPECT_EQ(ac.withThrottle(Protocol::Smb, kSmb, true, [] { return 7; }), 7);
    ac.deactivateExclusiveMode(kSmb);
    EXPECT_EQ(ac.withThrottle(Protocol::Smb, kSmb, false, [] { return 1; }), 1);
}

TEST(AdmissionController, LocalWorkIsNotThrottled) {
    AdmissionController ac;
    ac.activateExclusiveMode("local");
    EXPECT_EQ(ac.withThrottle(Protocol::Local, "local", false, [] { return 3; }), 3);
    EXPECT_FALSE(ac.snapshot("local").has_value());
}

TEST(AdmissionController, LimitOverrides) {
    AdmissionController ac;
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://h:22").maxConcurrent, 3);

    ac.setUserNetworkLimit(4);
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://h:22").maxConcurrent, 4);
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://h:22").minConcurrent, 2);
    EXPECT_EQ(ac.limitsFor(Protocol::Local, "local").maxConcurrent, 24);

    ac.setRecommendedThreads("sftp://h:22", 6);
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://h:22").maxConcurrent, 6);
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://other:22").maxConcurrent, 4);

    ac.setUserNetworkLimit(0);
    EXPECT_EQ(ac.limitsFor(Protocol::Sftp, "sftp://other:22").maxConcurrent, 3);
}

TEST(AdmissionController, UserLimitClearsEndpointState) {
    AdmissionController ac;
    runTimes(ac, Protocol::Smb, kSmb, 3, timedOut);
    ASSERT_TRUE(ac.isDegraded(kSmb));
    ac.setUserNetworkLimit(5);
    EXPECT_FALSE(ac.snapshot(kSmb).has_value());
    EXPECT_EQ(ac.currentLimit(kSmb), 0);
    runTimes(ac, Protocol::Smb, kSmb, 1, ok);
    EXPECT_EQ(ac.currentLimit(kSmb), 5);
}

TEST(AdmissionController, BufferSizeFeedsIoTuning) {
    AdmissionController ac;
    EXPECT_EQ(ac.ioTuning("sftp://h:22").chunkSize, AdmissionController::kDefaultBufferSize);
    EXPECT_EQ(ac.ioTuning("sftp://h:22").timeout, AdmissionController::kNormalTimeout);
    ac.setRecommendedBufferSize("sftp://h:22", 256 * 1024);
    EXPECT_EQ(ac.ioTuning("sftp://h:22").chunkSize, 256u * 1024u);
}

TEST(AdmissionController, ForceResetWakesWaiters) {
    AdmissionController ac;
    const std::string key = "ftp://h:21";
    ac.setRecommendedThreads(key, 1);
    std::atomic<bool> cancelled{false};
    std::thread waiter;
    ac.withThrottle(Protocol::Ftp, key, false, [&] {
        waiter = std::thread([&] {
            try {
                ac.withThrottle(Protocol::Ftp, key, false, [] { return 0; });
            } catch (const CancelledError&) {
                cancelled = true;
            }
        });
        std::this_thread::sleep_for(200ms);
        EXPECT_EQ(ac.forceReset(key), 1);
        return 0;
    });
    waiter.join();
    EXPECT_TRUE(cancelled.load());
    EXPECT_EQ(ac.forceReset("ftp://unknown:21"), 0);
}

TEST(AdmissionController, CancelWhileWaiting) {
    AdmissionController ac;
    const std::string key = "sftp://h:22";
    ac.setRecommendedThreads(key, 1);
    std::atomic<bool> stop{false};
    std::atomic<bool> cancelled{false};
    std::thread waiter;
    ac.withThrottle(Protocol::Sftp, key, false, [&] {
        waiter = std::thread([&] {
            try {
                ac.withThrottle(Protocol::Sftp, key, false, [] { return 0; }, [&] { return stop.load(); });
            } catch (const CancelledError&) {
                cancelled = true;
            }
        });
        stop = true;
        waiter.join();
        return 0;
    });
    EXPECT_TRUE(cancelled.load());
}
