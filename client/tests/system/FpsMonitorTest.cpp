#include "backend/managers/system/FpsMonitor.h"
#include "TestSupport.h"
#include <QSignalSpy>
#include <gtest/gtest.h>

TEST(FpsMonitorTest, FramesCountOnlyWhileMonitoring) {
    FpsMonitor monitor;
    QSignalSpy updated(&monitor, &FpsMonitor::fpsUpdated);
    monitor.recordMainFrame();

    monitor.startMonitoring();
    ASSERT_TRUE(monitor.isMonitoring());
    for (int i = 0; i < 30; ++i) monitor.recordMainFrame();
    for (int i = 0; i < 10; ++i) monitor.recordProjectionFrame();

    ASSERT_TRUE(waitUntil([&] { return updated.count() >= 1; }, FpsMonitor::SAMPLE_INTERVAL_MS * 3));
    EXPECT_GT(monitor.mainFps(), 0.0);
    EXPECT_GT(monitor.mainFps(), monitor.projectionFps());
    EXPECT_GT(monitor.projectionFps(), 0.0);
}

TEST(FpsMonitorTest, StopResetsReadings) {
    FpsMonitor monitor;
    monitor.startMonitoring();
    monitor.recordMainFrame();
    monitor.stopMonitoring();

    EXPECT_FALSE(monitor.isMonitoring());
    EXPECT_EQ(monitor.mainFps(), 0.0);
    EXPECT_EQ(monitor.projectionFps(), 0.0);

    monitor.startMonitoring();
    EXPECT_TRUE(monitor.isMonitoring());
}

TEST(FpsMonitorTest, DisposeIsFinalAndIdempotent) {
    FpsMonitor monitor;
    monitor.startMonitoring();

    EXPECT_TRUE(monitor.dispose());
    EXPECT_TRUE(monitor.isDisposed());
    EXPECT_FALSE(monitor.isMonitoring());
    EXPECT_FALSE(monitor.dispose());

    monitor.startMonitoring();
    monitor.recordMainFrame();
    EXPECT_FALSE(monitor.isMonitoring());
    monitor.stopMonitoring();
}

TEST(FpsMonitorTest, DisposeWhenIdleReportsNotRunning) {
    FpsMonitor monitor;
    EXPECT_FALSE(monitor.dispose());
    EXPECT_TRUE(monitor.isDisposed());
}
