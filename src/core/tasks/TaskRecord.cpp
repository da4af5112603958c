/**
 * TaskRecord.cpp
 */

#include "TaskRecord.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace umedia::core::tasks {

using utils::StringUtils;

const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Canceled:  return "canceled";
        case TaskStatus::NotFound:  return "not_found";
    }
    return "not_found";
}

std::optional<TaskStatus> parseTaskStatus(const std::string& name) {
    std::string normalized = StringUtils::toLower(StringUtils::trim(name));

    for (TaskStatus status : {TaskStatus::Pending, TaskStatus::Running, TaskStatus::Completed,
                              TaskStatus::Failed, TaskStatus::Canceled, TaskStatus::NotFound}) {
        if (normalized == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Canceled;
}

bool isLegalTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Pending:
            return to == TaskStatus::Running || to == TaskStatus::Canceled;
        case TaskStatus::Running:
            return isTerminal(to);
        default:
            return false;
    }
}

double TaskRecord::clampedProgress() const {
    return std::clamp(progress, 0.0, 100.0);
}

namespace {

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json optionalTimestamp(const std::optional<Clock::time_point>& value) {
    return value ? json(StringUtils::formatIso8601(*value)) : json(nullptr);
}

} // namespace

json toJson(const TaskRecord& record) {
    json payload = {
        {"task_id", record.id},
        {"url", record.parameters.url},
        {"media_type", toString(record.parameters.mediaKind)},
        {"quality", record.parameters.quality},
        {"format", optionalString(record.parameters.format)},
        {"status", toString(record.status)},
        {"is_done", record.isDone()},
        {"progress", record.clampedProgress()},
        {"file_path", nullptr},
        {"file_size", nullptr},
        {"error", optionalString(record.error)},
        {"warning", optionalString(record.warning)},
        {"started_at", StringUtils::formatIso8601(record.createdAt)},
        {"completed_at", optionalTimestamp(record.completedAt)}
    };

    if (record.result) {
        payload["file_path"] = record.result->path.string();
        if (record.result->size) {
            payload["file_size"] = *record.result->size;
        }
    }
    return payload;
}

json toJson(const TaskLookup& lookup) {
    if (lookup.record) {
        return toJson(*lookup.record);
    }
    return {
        {"task_id", lookup.taskId},
        {"status", toString(TaskStatus::NotFound)},
        {"progress", nullptr},
        {"file_path", nullptr},
        {"file_size", nullptr},
        {"error", "Unknown task_id."},
        {"started_at", nullptr},
        {"completed_at", nullptr}
    };
}

} // namespace umedia::core::tasks
