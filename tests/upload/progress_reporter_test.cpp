#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/upload/progress_reporter.hpp"

#include <gtest/gtest.h>

#include <vector>

using vidup::events::EventBus;
using vidup::events::UploadProgressEvent;
using vidup::upload::kGiB;
using vidup::upload::kMiB;
using vidup::upload::ProgressReporter;
using vidup::upload::UploadSession;

TEST(ProgressReporterTest, PercentRoundsToNearest) {
    EXPECT_EQ(ProgressReporter::percent(0, 10 * kMiB), 0);
    EXPECT_EQ(ProgressReporter::percent(4 * kMiB, 10 * kMiB), 40);
    EXPECT_EQ(ProgressReporter::percent(1, 3), 33);
    EXPECT_EQ(ProgressReporter::percent(2, 3), 67);
    EXPECT_EQ(ProgressReporter::percent(10 * kMiB, 10 * kMiB), 100);
}

TEST(ProgressReporterTest, PercentHandlesDegenerateInputs) {
    EXPECT_EQ(ProgressReporter::percent(0, 0), 0);
    EXPECT_EQ(ProgressReporter::percent(5, 0), 0);
    EXPECT_EQ(ProgressReporter::percent(20, 10), 100);
}

TEST(ProgressReporterTest, PercentIsExactForLargeFiles) {
    const std::uint64_t total = 40 * kGiB;
    EXPECT_EQ(ProgressReporter::percent(total / 2, total), 50);
    EXPECT_EQ(ProgressReporter::percent(total - 1, total), 100);
}

TEST(ProgressReporterTest, ReportPublishesSessionProgress) {
    EventBus bus;
    std::vector<UploadProgressEvent> events;
    bus.subscribe<UploadProgressEvent>([&](const UploadProgressEvent& e) { events.push_back(e); });

    UploadSession session;
    session.session_id = "abc";
    session.total_size = 10 * kMiB;
    session.offset = 6 * kMiB;

    ProgressReporter(bus).report(session);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].session_id, "abc");
    EXPECT_EQ(events[0].offset, 6 * kMiB);
    EXPECT_EQ(events[0].total_size, 10 * kMiB);
    EXPECT_EQ(events[0].percent, 60);
}
