#include "openxfer/Progress.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace openxfer;

TEST(ProgressThrottle, FirstAndFinalUpdatesAlwaysPass) {
    std::vector<TransferProgress> seen;
    ProgressThrottle t([&](const TransferProgress& p) { seen.push_back(p); }, std::chrono::hours(1));
    t.report(10, 100);
    t.report(20, 100);
    t.report(50, 100);
    t.report(100, 100);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].bytesTransferred, 10u);
    EXPECT_DOUBLE_EQ(seen[0].fraction, 0.1);
    EXPECT_EQ(seen[1].bytesTransferred, 100u);
    EXPECT_DOUBLE_EQ(seen[1].fraction, 1.0);
}

TEST(ProgressThrottle, FinishEmitsOnceUnlessAlreadyComplete) {
    int calls = 0;
    double last = 0;
    ProgressThrottle t([&](const TransferProgress& p) { ++calls; last = p.fraction; }, std::chrono::hours(1));
    t.report(5, 10);
    t.finish(10);
    t.finish(10);
    t.report(10, 10);
    EXPECT_EQ(calls, 2);
    EXPECT_DOUBLE_EQ(last, 1.0);
}

TEST(ProgressThrottle, ByteCallbackForwards) {
    int calls = 0;
    ProgressThrottle t([&](const TransferProgress&) { ++calls; });
    ByteProgressCB cb = t.byteCallback();
    ASSERT_TRUE(static_cast<bool>(cb));
    cb(4, 4);
    EXPECT_EQ(calls, 1);

    ProgressThrottle silent{ProgressCB{}};
    EXPECT_FALSE(static_cast<bool>(silent.byteCallback()));
}

TEST(SliceProgress, MapsPhasesIntoRange) {
    std::vector<double> fractions;
    ProgressCB cb = [&](const TransferProgress& p) { fractions.push_back(p.fraction); };
    ProgressCB down = sliceProgress(cb, 0.0, 0.5);
    ProgressCB up = sliceProgress(cb, 0.5, 1.0);
    TransferProgress p;
    p.fraction = 1.0;
    down(p);
    p.fraction = 0.5;
    up(p);
    p.fraction = 1.0;
    up(p);
    ASSERT_EQ(fractions.size(), 3u);
    EXPECT_DOUBLE_EQ(fractions[0], 0.5);
    EXPECT_DOUBLE_EQ(fractions[1], 0.75);
    EXPECT_DOUBLE_EQ(fractions[2], 1.0);
    EXPECT_FALSE(static_cast<bool>(sliceProgress(ProgressCB{}, 0.0, 0.5)));
}
