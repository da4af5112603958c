#include <gtest/gtest.h>

#include <set>
#include <thread>

#include "core/tasks/TaskRegistry.hpp"

namespace umedia::core::tasks {

namespace {

TaskParameters videoParameters(const std::string& url) {
    TaskParameters parameters;
    parameters.url = url;
    parameters.mediaKind = MediaKind::Video;
    parameters.quality = "best";
    return parameters;
}

} // namespace

TEST(task_registry, create_and_get) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("https://a"));

    EXPECT_EQ(id.size(), 32u);
    auto record = registry.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->status, TaskStatus::Pending);
    EXPECT_DOUBLE_EQ(record->progress, 0.0);
    EXPECT_EQ(record->parameters.url, "https://a");
    EXPECT_FALSE(record->completedAt.has_value());
    EXPECT_FALSE(registry.get("unknown").has_value());
}

TEST(task_registry, ids_are_unique) {
    TaskRegistry registry;
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.insert(registry.create(videoParameters("u")));
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(registry.size(), 200u);
}

TEST(task_registry, list_newest_first) {
    TaskRegistry registry;
    std::string first = registry.create(videoParameters("1"));
    std::string second = registry.create(videoParameters("2"));
    std::string third = registry.create(videoParameters("3"));

    auto records = registry.list();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, third);
    EXPECT_EQ(records[1].id, second);
    EXPECT_EQ(records[2].id, first);
}

TEST(task_registry, list_filter) {
    TaskRegistry registry;
    std::string pending = registry.create(videoParameters("1"));
    std::string running = registry.create(videoParameters("2"));
    ASSERT_TRUE(registry.beginRun(running));

    auto runningOnly = registry.list(std::string("RUNNING"));
    ASSERT_EQ(runningOnly.size(), 1u);
    EXPECT_EQ(runningOnly[0].id, running);

    auto pendingOnly = registry.list(std::string("pending"));
    ASSERT_EQ(pendingOnly.size(), 1u);
    EXPECT_EQ(pendingOnly[0].id, pending);

    EXPECT_TRUE(registry.list(std::string("bogus")).empty());
    EXPECT_EQ(registry.list(std::string("")).size(), 2u);
}

TEST(task_registry, partial_update_merges_engaged_fields) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));
    ASSERT_TRUE(registry.beginRun(id));

    TaskUpdate progress;
    progress.progress = 40.0;
    EXPECT_TRUE(registry.applyUpdate(id, progress));

    TaskUpdate warning;
    warning.warning = "slow";
    EXPECT_TRUE(registry.applyUpdate(id, warning));

    auto record = registry.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->progress, 40.0);
    EXPECT_EQ(record->warning, std::optional<std::string>("slow"));
    EXPECT_EQ(record->status, TaskStatus::Running);
    EXPECT_FALSE(record->error.has_value());

    EXPECT_FALSE(registry.applyUpdate("unknown", progress));
}

TEST(task_registry, terminal_records_are_frozen) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));
    ASSERT_TRUE(registry.beginRun(id));

    TaskUpdate done;
    done.status = TaskStatus::Completed;
    done.progress = 100.0;
    ASSERT_TRUE(registry.applyUpdate(id, done));

    auto completed = registry.get(id);
    ASSERT_TRUE(completed.has_value());
    ASSERT_TRUE(completed->completedAt.has_value());
    auto completedAt = *completed->completedAt;

    TaskUpdate late;
    late.progress = 10.0;
    EXPECT_FALSE(registry.applyUpdate(id, late));

    TaskUpdate failed;
    failed.status = TaskStatus::Failed;
    failed.error = "boom";
    EXPECT_FALSE(registry.applyUpdate(id, failed));

    auto record = registry.get(id);
    EXPECT_EQ(record->status, TaskStatus::Completed);
    EXPECT_DOUBLE_EQ(record->progress, 100.0);
    EXPECT_FALSE(record->error.has_value());
    EXPECT_EQ(*record->completedAt, completedAt);
}

TEST(task_registry, rejects_illegal_transitions) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));

    TaskUpdate skip;
    skip.status = TaskStatus::Completed;
    EXPECT_FALSE(registry.applyUpdate(id, skip));
    EXPECT_EQ(registry.get(id)->status, TaskStatus::Pending);

    ASSERT_TRUE(registry.beginRun(id));
    EXPECT_FALSE(registry.beginRun(id));

    TaskUpdate back;
    back.status = TaskStatus::Pending;
    EXPECT_FALSE(registry.applyUpdate(id, back));
    EXPECT_EQ(registry.get(id)->status, TaskStatus::Running);
}

TEST(task_registry, cancel_pending_task_directly) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));

    CancelOutcome outcome = registry.requestCancel(id);
    EXPECT_EQ(outcome.disposition, CancelDisposition::CanceledDirectly);
    EXPECT_EQ(outcome.status, TaskStatus::Canceled);

    auto record = registry.get(id);
    EXPECT_EQ(record->status, TaskStatus::Canceled);
    EXPECT_TRUE(record->cancelRequested);
    EXPECT_EQ(record->error, std::optional<std::string>("Canceled."));
    EXPECT_TRUE(record->completedAt.has_value());

    // The worker that shows up late must not resurrect it
    EXPECT_FALSE(registry.beginRun(id));
}

TEST(task_registry, cancel_running_task_sets_flag) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));
    ASSERT_TRUE(registry.beginRun(id));

    CancellationFlag flag = registry.cancellationFlag(id);
    ASSERT_NE(flag, nullptr);
    EXPECT_FALSE(flag->load());

    CancelOutcome outcome = registry.requestCancel(id);
    EXPECT_EQ(outcome.disposition, CancelDisposition::Requested);
    EXPECT_EQ(outcome.status, TaskStatus::Running);
    EXPECT_TRUE(flag->load());

    auto record = registry.get(id);
    EXPECT_EQ(record->status, TaskStatus::Running);
    EXPECT_TRUE(record->cancelRequested);

    // Repeated requests are harmless
    EXPECT_EQ(registry.requestCancel(id).disposition, CancelDisposition::Requested);
}

TEST(task_registry, cancel_terminal_and_unknown) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));
    ASSERT_TRUE(registry.beginRun(id));

    TaskUpdate failed;
    failed.status = TaskStatus::Failed;
    failed.error = "boom";
    ASSERT_TRUE(registry.applyUpdate(id, failed));

    CancelOutcome outcome = registry.requestCancel(id);
    EXPECT_EQ(outcome.disposition, CancelDisposition::AlreadyTerminal);
    EXPECT_EQ(outcome.status, TaskStatus::Failed);
    EXPECT_FALSE(registry.get(id)->cancelRequested);

    EXPECT_EQ(registry.requestCancel("nope").disposition, CancelDisposition::NotFound);
    EXPECT_EQ(registry.cancellationFlag("nope"), nullptr);
}

TEST(task_registry, side_files_are_deduplicated) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));

    EXPECT_TRUE(registry.appendSideFile(id, "/d/a.mp4"));
    EXPECT_TRUE(registry.appendSideFile(id, "/d/a.m4a"));
    EXPECT_FALSE(registry.appendSideFile(id, "/d/a.mp4"));
    EXPECT_FALSE(registry.appendSideFile(id, ""));
    EXPECT_FALSE(registry.appendSideFile("unknown", "/d/x"));

    auto files = registry.sideFiles(id);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "/d/a.mp4");
    EXPECT_EQ(files[1], "/d/a.m4a");
}

TEST(task_registry, concurrent_updates_stay_consistent) {
    TaskRegistry registry;
    std::string id = registry.create(videoParameters("u"));
    ASSERT_TRUE(registry.beginRun(id));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&registry, &id, t]() {
            for (int i = 0; i < 250; ++i) {
                TaskUpdate update;
                update.progress = static_cast<double>((t * 250 + i) % 99);
                registry.applyUpdate(id, update);
                registry.appendSideFile(id, "/d/" + std::to_string(t) + "_" + std::to_string(i));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(registry.sideFiles(id).size(), 1000u);
    EXPECT_EQ(registry.get(id)->status, TaskStatus::Running);
}

} // namespace umedia::core::tasks
