/**
 * TaskRegistry.cpp
 */

#include "TaskRegistry.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace umedia::core::tasks {

std::string TaskRegistry::create(const TaskParameters& parameters) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string taskId = utils::StringUtils::generateHexId();
    while (m_tasks.count(taskId) > 0) {
        taskId = utils::StringUtils::generateHexId();
    }

    Entry entry;
    entry.record.id = taskId;
    entry.record.parameters = parameters;
    entry.record.status = TaskStatus::Pending;
    entry.record.createdAt = Clock::now();
    entry.sequence = m_nextSequence++;
    entry.cancelFlag = std::make_shared<std::atomic<bool>>(false);

    m_tasks.emplace(taskId, std::move(entry));
    return taskId;
}

std::optional<TaskRecord> TaskRegistry::get(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<TaskRecord> TaskRegistry::list(const std::optional<std::string>& statusFilter) const {
    std::optional<TaskStatus> wanted;
    bool filtering = false;
    if (statusFilter && !utils::StringUtils::trim(*statusFilter).empty()) {
        filtering = true;
        wanted = parseTaskStatus(*statusFilter);
        if (!wanted) {
            // Nothing is stored under an unknown status
            return {};
        }
    }

    std::vector<const Entry*> matches;
    std::vector<TaskRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        matches.reserve(m_tasks.size());
        for (const auto& [id, entry] : m_tasks) {
            if (!filtering || entry.record.status == *wanted) {
                matches.push_back(&entry);
            }
        }

        std::sort(matches.begin(), matches.end(), [](const Entry* a, const Entry* b) {
            if (a->record.createdAt != b->record.createdAt) {
                return a->record.createdAt > b->record.createdAt;
            }
            return a->sequence > b->sequence;
        });

        records.reserve(matches.size());
        for (const Entry* entry : matches) {
            records.push_back(entry->record);
        }
    }
    return records;
}

bool TaskRegistry::applyUpdate(const std::string& taskId, const TaskUpdate& update) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return false;
    }

    Entry& entry = it->second;
    TaskRecord& record = entry.record;

    if (record.isDone()) {
        Logger::instance().debug("Ignoring update for finished task {} ({})", taskId, toString(record.status));
        return false;
    }

    if (update.status && !isLegalTransition(record.status, *update.status)) {
        Logger::instance().debug("Rejected transition {} -> {} for task {}",
            toString(record.status), toString(*update.status), taskId);
        return false;
    }

    if (update.progress) {
        record.progress = *update.progress;
    }
    if (update.result) {
        record.result = update.result;
    }
    if (update.error) {
        record.error = update.error;
    }
    if (update.warning) {
        record.warning = update.warning;
    }
    if (update.status) {
        if (isTerminal(*update.status)) {
            markTerminal(entry, *update.status);
        } else {
            record.status = *update.status;
        }
    }
    return true;
}

bool TaskRegistry::beginRun(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end() || it->second.record.status != TaskStatus::Pending) {
        return false;
    }

    it->second.live = true;
    it->second.record.status = TaskStatus::Running;
    it->second.record.progress = 0.0;
    return true;
}

CancelOutcome TaskRegistry::requestCancel(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return {CancelDisposition::NotFound, TaskStatus::NotFound};
    }

    Entry& entry = it->second;
    if (entry.record.isDone()) {
        return {CancelDisposition::AlreadyTerminal, entry.record.status};
    }

    entry.cancelFlag->store(true);
    entry.record.cancelRequested = true;

    if (!entry.live) {
        entry.record.error = "Canceled.";
        markTerminal(entry, TaskStatus::Canceled);
        return {CancelDisposition::CanceledDirectly, TaskStatus::Canceled};
    }
    return {CancelDisposition::Requested, entry.record.status};
}

CancellationFlag TaskRegistry::cancellationFlag(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return nullptr;
    }
    return it->second.cancelFlag;
}

bool TaskRegistry::appendSideFile(const std::string& taskId, const std::string& path) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return false;
    }

    auto& files = it->second.record.sideFiles;
    if (std::find(files.begin(), files.end(), path) != files.end()) {
        return false;
    }
    files.push_back(path);
    return true;
}

std::vector<std::string> TaskRegistry::sideFiles(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return {};
    }
    return it->second.record.sideFiles;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void TaskRegistry::markTerminal(Entry& entry, TaskStatus status) {
    entry.record.status = status;
    entry.record.completedAt = Clock::now();
    entry.live = false;
}

} // namespace umedia::core::tasks
