#pragma once

/**
 * TaskRecord.hpp
 *
 * Identity and mutable state of one background job.
 */

#include "TaskParameters.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace umedia::core::tasks {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

/**
 * Task status
 *
 * NotFound is only ever produced for lookups of unknown ids. The registry
 * never stores it.
 */
enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Canceled,
    NotFound
};

const char* toString(TaskStatus status);

/**
 * Case-insensitive parse of a status name ("COMPLETED", " pending ")
 */
std::optional<TaskStatus> parseTaskStatus(const std::string& name);

bool isTerminal(TaskStatus status);

/**
 * pending -> running -> {completed, failed, canceled}, plus
 * pending -> canceled for tasks whose worker never went live.
 */
bool isLegalTransition(TaskStatus from, TaskStatus to);

/**
 * Final artifact of a task
 */
struct TaskResult {
    std::filesystem::path path;
    std::optional<uint64_t> size;
};

/**
 * TaskRecord - snapshot of a task as stored in the registry
 */
struct TaskRecord {
    std::string id;
    TaskParameters parameters;

    TaskStatus status{TaskStatus::Pending};

    // Raw value as last reported; use clampedProgress() for display
    double progress{0.0};

    std::optional<TaskResult> result;
    std::optional<std::string> error;
    std::optional<std::string> warning;

    Clock::time_point createdAt{};
    std::optional<Clock::time_point> completedAt;

    bool cancelRequested{false};
    std::vector<std::string> sideFiles;

    bool isDone() const { return isTerminal(status); }

    double clampedProgress() const;
};

/**
 * Partial update. Only engaged fields are merged; absent fields are left
 * untouched. completedAt is stamped by the registry, never supplied.
 */
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<double> progress;
    std::optional<TaskResult> result;
    std::optional<std::string> error;
    std::optional<std::string> warning;

    bool empty() const {
        return !status && !progress && !result && !error && !warning;
    }
};

/**
 * Result of a status lookup: a record, or not_found
 */
struct TaskLookup {
    std::string taskId;
    std::optional<TaskRecord> record;

    bool found() const { return record.has_value(); }
    TaskStatus status() const { return record ? record->status : TaskStatus::NotFound; }
};

/**
 * Status payload of a record
 */
json toJson(const TaskRecord& record);

/**
 * Status payload of a lookup, with the not_found shape for unknown ids
 */
json toJson(const TaskLookup& lookup);

} // namespace umedia::core::tasks
