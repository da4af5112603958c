/**
 * TaskManager.cpp
 *
 * Scheduler, state machine driver and bulk polling.
 */

#include "TaskManager.hpp"
#include "ResultSelector.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <type_traits>
#include <variant>

namespace umedia::core::tasks {

using retrieval::RetrievalCanceled;
using retrieval::RetrievalFailed;
using retrieval::RetrievalOutcome;
using retrieval::RetrievalRequest;
using retrieval::RetrievedArtifact;

namespace {

const char* kCancelRequested = "cancel_requested";
const char* kNoOutputWarning = "Retrieval finished without producing an output file.";

} // namespace

// -- Response helpers --

std::optional<WaitMode> parseWaitMode(const std::string& name) {
    std::string normalized = utils::StringUtils::toLower(utils::StringUtils::trim(name));
    if (normalized == "any") return WaitMode::Any;
    if (normalized == "all") return WaitMode::All;
    return std::nullopt;
}

std::vector<std::string> BatchStatus::completedFilePaths() const {
    std::vector<std::string> paths;
    for (const auto& lookup : completed) {
        if (lookup.record && lookup.record->result) {
            paths.push_back(lookup.record->result->path.string());
        }
    }
    return paths;
}

std::string BatchStatus::description() const {
    if (error) {
        return *error;
    }
    if (allDone) {
        return "All " + std::to_string(completed.size()) + " downloads complete. Process files.";
    }
    if (!completed.empty()) {
        return std::to_string(completed.size()) + " completed, " +
               std::to_string(pending.size()) + " still downloading. "
               "Process completed files or check again.";
    }
    return "All " + std::to_string(pending.size()) + " downloads still in progress. "
           "Check again in a few seconds.";
}

json toJson(const StartResponse& response) {
    json payload = {
        {"task_id", response.taskId ? json(*response.taskId) : json(nullptr)},
        {"status", response.status},
        {"url", response.url},
        {"error", response.error ? json(*response.error) : json(nullptr)}
    };
    if (response.taskId) {
        payload["recommended_poll_seconds"] = response.recommendedPollSeconds;
    }
    return payload;
}

json toJson(const CancelResponse& response) {
    return {
        {"task_id", response.taskId},
        {"status", response.status},
        {"error", response.error ? json(*response.error) : json(nullptr)}
    };
}

json toJson(const BatchStatus& status) {
    json completed = json::array();
    for (const auto& lookup : status.completed) {
        completed.push_back(toJson(lookup));
    }
    return {
        {"completed", completed},
        {"pending", status.pending},
        {"all_done", status.allDone},
        {"timed_out", status.timedOut},
        {"error", status.error ? json(*status.error) : json(nullptr)},
        {"next_action", {
            {"description", status.description()},
            {"pending_task_ids", status.pending},
            {"completed_file_paths", status.completedFilePaths()}
        }}
    };
}

// -- TaskManager --

TaskManager::TaskManager(retrieval::RetrievalOperation retrieval,
                         TaskDefaults defaults,
                         ArtifactRemover remover)
    : m_retrieval(std::move(retrieval))
    , m_defaults(std::move(defaults))
    , m_remover(std::move(remover)) {
}

TaskManager::~TaskManager() {
    shutdown();
}

StartResponse TaskManager::startDownload(const DownloadRequest& request) {
    StartResponse response;
    response.url = request.url;
    response.recommendedPollSeconds = m_defaults.pollIntervalSeconds;

    TaskParameters parameters;
    try {
        parameters = normalizeParameters(request, m_defaults);
    } catch (const ValidationError& e) {
        Logger::instance().warn("Rejected download request for {}: {}", request.url, e.what());
        response.status = toString(TaskStatus::Failed);
        response.error = e.what();
        return response;
    }

    std::lock_guard<std::mutex> lock(m_workersMutex);

    if (m_stopping) {
        response.status = toString(TaskStatus::Failed);
        response.error = "Task manager is shutting down.";
        return response;
    }

    // Reap workers of finished tasks so the map does not grow unbounded
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        auto record = m_registry.get(it->first);
        if (record && record->isDone() && it->second.joinable()) {
            it->second.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }

    std::string taskId = m_registry.create(parameters);

    try {
        m_workers.emplace(taskId, std::thread([this, taskId]() { runTask(taskId); }));
    } catch (const std::system_error& e) {
        Logger::instance().critical("Cannot start worker for task {}: {}", taskId, e.what());
        m_registry.requestCancel(taskId);
        notifyCompletion();
        throw;
    }

    Logger::instance().info("Created {} task {} for {} (quality: {})",
        toString(parameters.mediaKind), taskId, parameters.url, parameters.quality);

    response.taskId = taskId;
    response.status = "started";
    return response;
}

TaskLookup TaskManager::getStatus(const std::string& taskId) const {
    return TaskLookup{taskId, m_registry.get(taskId)};
}

std::vector<TaskRecord> TaskManager::listDownloads(const std::optional<std::string>& statusFilter) const {
    return m_registry.list(statusFilter);
}

CancelResponse TaskManager::cancel(const std::string& taskId) {
    CancelOutcome outcome = m_registry.requestCancel(taskId);

    CancelResponse response;
    response.taskId = taskId;

    switch (outcome.disposition) {
        case CancelDisposition::NotFound:
            response.status = toString(TaskStatus::NotFound);
            response.error = "Unknown task_id.";
            break;
        case CancelDisposition::AlreadyTerminal:
            response.status = toString(outcome.status);
            break;
        case CancelDisposition::CanceledDirectly:
            Logger::instance().info("Task {} canceled before its worker started", taskId);
            response.status = toString(TaskStatus::Canceled);
            notifyCompletion();
            break;
        case CancelDisposition::Requested:
            Logger::instance().info("Cancellation requested for task {}", taskId);
            response.status = kCancelRequested;
            break;
    }
    return response;
}

BatchStatus TaskManager::checkMany(const std::vector<std::string>& taskIds) const {
    BatchStatus status;

    if (taskIds.empty()) {
        status.allDone = true;
        status.error = "No task IDs provided.";
        return status;
    }

    for (const auto& taskId : taskIds) {
        TaskLookup lookup = getStatus(taskId);
        if (!lookup.found() || lookup.record->isDone()) {
            status.completed.push_back(std::move(lookup));
        } else {
            status.pending.push_back(taskId);
        }
    }

    status.allDone = status.pending.empty();
    return status;
}

BatchStatus TaskManager::waitForAnyOrAll(const std::vector<std::string>& taskIds,
                                         WaitMode mode,
                                         std::chrono::milliseconds timeout) {
    auto satisfied = [mode](const BatchStatus& status) {
        return mode == WaitMode::Any ? !status.completed.empty() : status.pending.empty();
    };

    const auto deadline = std::chrono::steady_clock::now() +
                          std::max(timeout, std::chrono::milliseconds::zero());

    std::unique_lock<std::mutex> lock(m_waitMutex);
    while (true) {
        const uint64_t generation = m_completionGeneration;

        lock.unlock();
        BatchStatus status = checkMany(taskIds);
        lock.lock();

        if (status.error || satisfied(status)) {
            return status;
        }

        bool woke = m_completionCondition.wait_until(lock, deadline, [this, generation] {
            return m_completionGeneration != generation;
        });

        if (!woke) {
            lock.unlock();
            status = checkMany(taskIds);
            status.timedOut = !satisfied(status);
            return status;
        }
    }
}

void TaskManager::shutdown() {
    std::unordered_map<std::string, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        if (m_stopping.exchange(true) && m_workers.empty()) {
            return;
        }
        workers.swap(m_workers);
    }

    size_t outstanding = 0;
    for (const auto& record : m_registry.list()) {
        if (!record.isDone()) {
            m_registry.requestCancel(record.id);
            ++outstanding;
        }
    }
    if (outstanding > 0) {
        Logger::instance().info("Shutting down task manager, canceling {} task(s)", outstanding);
        notifyCompletion();
    }

    for (auto& [taskId, worker] : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TaskManager::runTask(const std::string& taskId) {
    if (!m_registry.beginRun(taskId)) {
        // Canceled while still pending
        Logger::instance().debug("Task {} no longer pending, worker exits", taskId);
        notifyCompletion();
        return;
    }

    auto snapshot = m_registry.get(taskId);
    CancellationFlag cancelFlag = m_registry.cancellationFlag(taskId);
    if (!snapshot || !cancelFlag) {
        return;
    }

    Logger::instance().debug("Task {} running", taskId);

    ProgressMonitor monitor(m_registry, taskId, cancelFlag, m_remover);
    RetrievalRequest request{taskId, snapshot->parameters};

    RetrievalOutcome outcome;
    try {
        outcome = m_retrieval(request, monitor.reporter());
    } catch (const std::exception& e) {
        std::string message = e.what();
        outcome = RetrievalFailed{message.empty() ? "Retrieval failed." : message};
    } catch (...) {
        outcome = RetrievalFailed{"Retrieval failed with an unknown error."};
    }

    finishTask(*snapshot, monitor, cancelFlag, outcome);
    notifyCompletion();
}

void TaskManager::finishTask(const TaskRecord& snapshot,
                             const ProgressMonitor& monitor,
                             const CancellationFlag& cancelFlag,
                             const RetrievalOutcome& outcome) {
    const bool cancelRequested = cancelFlag->load();

    std::visit([&](const auto& result) {
        using T = std::decay_t<decltype(result)>;

        if constexpr (std::is_same_v<T, RetrievalCanceled>) {
            cancelTask(snapshot, result.message.empty() ? "Canceled by user." : result.message);
        } else if (monitor.cancellationObserved()) {
            // The operation ignored the stop request; the task is still canceled
            cancelTask(snapshot, "Canceled by user.");
        } else if (cancelRequested) {
            // Canceled while the operation was returning; never salvaged
            cancelTask(snapshot, "Canceled by user.");
        } else if constexpr (std::is_same_v<T, RetrievedArtifact>) {
            completeTask(snapshot, result);
        } else {
            failTask(snapshot, result.message);
        }
    }, outcome);
}

void TaskManager::completeTask(const TaskRecord& snapshot, const RetrievedArtifact& artifact) {
    std::optional<TaskResult> result;

    if (!artifact.path.empty() && !isPartialArtifact(artifact.path)) {
        result = TaskResult{artifact.path, artifact.size};
        if (!result->size) {
            result->size = utils::FileUtils::getFileSize(artifact.path);
        }
    } else {
        result = selectPrimaryArtifact(m_registry.sideFiles(snapshot.id),
                                       preferredContainer(snapshot.parameters));
    }

    TaskUpdate update;
    update.status = TaskStatus::Completed;
    update.progress = 100.0;
    update.result = result;
    if (!result) {
        update.warning = kNoOutputWarning;
    }

    if (!m_registry.applyUpdate(snapshot.id, update)) {
        Logger::instance().warn("Could not record completion of task {}", snapshot.id);
        return;
    }

    if (result) {
        Logger::instance().info("Task {} completed: {}", snapshot.id, result->path.string());
    } else {
        Logger::instance().warn("Task {} completed without an output file", snapshot.id);
    }
}

void TaskManager::failTask(const TaskRecord& snapshot, const std::string& message) {
    auto salvaged = selectPrimaryArtifact(m_registry.sideFiles(snapshot.id),
                                          preferredContainer(snapshot.parameters));

    TaskUpdate update;
    if (salvaged) {
        update.status = TaskStatus::Completed;
        update.progress = 100.0;
        update.result = salvaged;
        update.warning = message;
    } else {
        update.status = TaskStatus::Failed;
        update.error = message;
    }

    if (!m_registry.applyUpdate(snapshot.id, update)) {
        Logger::instance().warn("Could not record failure of task {}", snapshot.id);
        return;
    }

    if (salvaged) {
        Logger::instance().warn("Task {} failed ({}), salvaged {}", snapshot.id, message,
            salvaged->path.string());
    } else {
        Logger::instance().error("Task {} failed: {}", snapshot.id, message);
    }
}

void TaskManager::cancelTask(const TaskRecord& snapshot, const std::string& message) {
    TaskUpdate update;
    update.status = TaskStatus::Canceled;
    update.error = message;

    if (!m_registry.applyUpdate(snapshot.id, update)) {
        Logger::instance().warn("Could not record cancellation of task {}", snapshot.id);
        return;
    }
    Logger::instance().info("Task {} canceled", snapshot.id);
}

void TaskManager::notifyCompletion() {
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        ++m_completionGeneration;
    }
    m_completionCondition.notify_all();
}

} // namespace umedia::core::tasks
