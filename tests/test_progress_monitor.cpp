#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "core/tasks/ProgressMonitor.hpp"

namespace umedia::core::tasks {

using retrieval::ProgressEvent;

namespace {

ProgressEvent downloading(std::optional<int64_t> transferred,
                          std::optional<int64_t> total,
                          std::optional<int64_t> estimate = std::nullopt) {
    ProgressEvent event;
    event.status = "downloading";
    event.transferredBytes = transferred;
    event.totalBytes = total;
    event.totalBytesEstimate = estimate;
    return event;
}

ProgressEvent finished(const std::string& finalPath) {
    ProgressEvent event;
    event.status = "finished";
    event.finalPath = std::filesystem::path(finalPath);
    return event;
}

class progress_monitor : public ::testing::Test {
protected:
    void SetUp() override {
        TaskParameters parameters;
        parameters.url = "u";
        parameters.quality = "best";
        m_id = m_registry.create(parameters);
        ASSERT_TRUE(m_registry.beginRun(m_id));
    }

    double progress() const { return m_registry.get(m_id)->progress; }

    TaskRegistry m_registry;
    std::string m_id;
};

} // namespace

TEST(progress_percent, uses_total_bytes) {
    auto percent = extractProgressPercent(downloading(50, 200));
    ASSERT_TRUE(percent.has_value());
    EXPECT_DOUBLE_EQ(*percent, 25.0);
}

TEST(progress_percent, falls_back_to_estimate) {
    auto percent = extractProgressPercent(downloading(30, std::nullopt, 60));
    ASSERT_TRUE(percent.has_value());
    EXPECT_DOUBLE_EQ(*percent, 50.0);

    percent = extractProgressPercent(downloading(30, 0, 120));
    ASSERT_TRUE(percent.has_value());
    EXPECT_DOUBLE_EQ(*percent, 25.0);
}

TEST(progress_percent, indeterminate_events) {
    EXPECT_FALSE(extractProgressPercent(downloading(30, std::nullopt)).has_value());
    EXPECT_FALSE(extractProgressPercent(downloading(std::nullopt, 100)).has_value());
    EXPECT_FALSE(extractProgressPercent(downloading(30, 0, 0)).has_value());
    EXPECT_FALSE(extractProgressPercent(finished("/d/x.mp4")).has_value());
}

TEST(progress_percent, clamped) {
    auto over = extractProgressPercent(downloading(300, 100));
    ASSERT_TRUE(over.has_value());
    EXPECT_DOUBLE_EQ(*over, 100.0);

    auto under = extractProgressPercent(downloading(-5, 100));
    ASSERT_TRUE(under.has_value());
    EXPECT_DOUBLE_EQ(*under, 0.0);
}

TEST_F(progress_monitor, writes_progress) {
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id));

    EXPECT_TRUE(monitor(downloading(50, 200)));
    EXPECT_DOUBLE_EQ(progress(), 25.0);

    // Indeterminate events leave progress alone
    EXPECT_TRUE(monitor(downloading(60, std::nullopt)));
    EXPECT_DOUBLE_EQ(progress(), 25.0);
}

TEST_F(progress_monitor, never_reports_completion_in_flight) {
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id));

    EXPECT_TRUE(monitor(downloading(200, 200)));
    EXPECT_DOUBLE_EQ(progress(), 99.0);

    EXPECT_TRUE(monitor(downloading(900, 200)));
    EXPECT_DOUBLE_EQ(progress(), 99.0);
    EXPECT_EQ(m_registry.get(m_id)->status, TaskStatus::Running);
}

TEST_F(progress_monitor, finished_event_records_side_file) {
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id));

    EXPECT_TRUE(monitor(downloading(10, 100)));
    EXPECT_TRUE(monitor(finished("/d/video.f137.mp4")));
    EXPECT_DOUBLE_EQ(progress(), 99.0);
    EXPECT_TRUE(monitor(finished("/d/video.f140.m4a")));
    EXPECT_TRUE(monitor(finished("/d/video.f137.mp4")));

    auto files = m_registry.sideFiles(m_id);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "/d/video.f137.mp4");
    EXPECT_EQ(files[1], "/d/video.f140.m4a");
}

TEST_F(progress_monitor, cancellation_stops_and_cleans_up) {
    std::vector<std::filesystem::path> removed;
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id),
        [&removed](const std::filesystem::path& path) { removed.push_back(path); });

    EXPECT_TRUE(monitor(downloading(10, 100)));
    EXPECT_FALSE(monitor.cancellationObserved());

    m_registry.requestCancel(m_id);

    ProgressEvent event = downloading(20, 100);
    event.tempPath = std::filesystem::path("/tmp/umedia/video.mp4.part");
    event.finalPath = std::filesystem::path("/d/video.mp4");
    EXPECT_FALSE(monitor(event));
    EXPECT_TRUE(monitor.cancellationObserved());

    // Only the in-progress file is removed, and progress is not written
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], std::filesystem::path("/tmp/umedia/video.mp4.part"));
    EXPECT_DOUBLE_EQ(progress(), 10.0);

    // A finished file arriving after cancellation is not recorded
    EXPECT_FALSE(monitor(finished("/d/video.mp4")));
    EXPECT_TRUE(m_registry.sideFiles(m_id).empty());
}

TEST_F(progress_monitor, cleanup_errors_are_ignored) {
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id),
        [](const std::filesystem::path&) { throw std::runtime_error("permission denied"); });

    m_registry.requestCancel(m_id);

    ProgressEvent event = downloading(20, 100);
    event.tempPath = std::filesystem::path("/tmp/umedia/a.part");
    EXPECT_FALSE(monitor(event));
}

TEST_F(progress_monitor, reporter_forwards_to_monitor) {
    ProgressMonitor monitor(m_registry, m_id, m_registry.cancellationFlag(m_id));
    retrieval::ProgressReporter report = monitor.reporter();

    EXPECT_TRUE(report(downloading(1, 4)));
    EXPECT_DOUBLE_EQ(progress(), 25.0);

    m_registry.requestCancel(m_id);
    EXPECT_FALSE(report(downloading(2, 4)));
}

} // namespace umedia::core::tasks
