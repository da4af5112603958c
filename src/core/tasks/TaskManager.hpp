#pragma once

/**
 * TaskManager.hpp
 *
 * Background job manager. Runs retrieval operations off the caller's path,
 * one worker thread per task, and lets callers poll or cancel them without
 * blocking.
 */

#include "TaskRegistry.hpp"
#include "ProgressMonitor.hpp"
#include "../retrieval/Retrieval.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace umedia::core::tasks {

using json = nlohmann::json;

/**
 * Reply to a start request
 */
struct StartResponse {
    std::optional<std::string> taskId;
    std::string status;  // "started" or "failed"
    std::string url;
    std::optional<std::string> error;
    int recommendedPollSeconds{2};
};

/**
 * Reply to a cancellation request.
 * status is "not_found", the existing terminal status, "canceled" or
 * "cancel_requested".
 */
struct CancelResponse {
    std::string taskId;
    std::string status;
    std::optional<std::string> error;
};

enum class WaitMode {
    Any,
    All
};

std::optional<WaitMode> parseWaitMode(const std::string& name);

/**
 * Bulk poll result. Unknown ids count as done and are reported in
 * completed with status not_found.
 */
struct BatchStatus {
    std::vector<TaskLookup> completed;
    std::vector<std::string> pending;
    bool allDone{false};
    bool timedOut{false};
    std::optional<std::string> error;

    std::vector<std::string> completedFilePaths() const;
    std::string description() const;
};

json toJson(const StartResponse& response);
json toJson(const CancelResponse& response);
json toJson(const BatchStatus& status);

/**
 * TaskManager - scheduler and public face of the task core
 *
 * Every outcome of a retrieval (success, cancellation, failure, exception)
 * is converted into a terminal record state; nothing escapes a worker.
 * Partial failures with a usable produced file end as completed with a
 * warning.
 */
class TaskManager {
public:
    /**
     * @param retrieval Operation run once per task on its worker thread
     * @param defaults Quality/format defaults for normalization
     * @param remover Scoped deleter for incomplete artifacts (may be null)
     */
    explicit TaskManager(retrieval::RetrievalOperation retrieval,
                         TaskDefaults defaults = TaskDefaults{},
                         ArtifactRemover remover = nullptr);

    /**
     * Destructor - cancels outstanding tasks and joins their workers
     */
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    /**
     * Validate the request, create a pending task and launch its worker.
     * Returns immediately. Invalid media kinds yield status "failed" and
     * no task.
     */
    StartResponse startDownload(const DownloadRequest& request);

    /**
     * Current record of a task, or not_found
     */
    TaskLookup getStatus(const std::string& taskId) const;

    /**
     * All tasks newest first, optionally filtered by status name
     */
    std::vector<TaskRecord> listDownloads(const std::optional<std::string>& statusFilter = std::nullopt) const;

    /**
     * Request cooperative cancellation. Idempotent for finished tasks.
     */
    CancelResponse cancel(const std::string& taskId);

    /**
     * Non-blocking bulk poll
     */
    BatchStatus checkMany(const std::vector<std::string>& taskIds) const;

    /**
     * Block until any (or all) of the tasks are done, or the timeout
     * elapses, whichever comes first.
     */
    BatchStatus waitForAnyOrAll(const std::vector<std::string>& taskIds,
                                WaitMode mode,
                                std::chrono::milliseconds timeout);

    /**
     * Cancel every unfinished task and join all workers.
     * Further start requests are rejected.
     */
    void shutdown();

    const TaskDefaults& defaults() const { return m_defaults; }

private:
    /**
     * Worker body, one per task
     */
    void runTask(const std::string& taskId);

    /**
     * Classify the outcome of the retrieval and write the terminal update
     */
    void finishTask(const TaskRecord& snapshot,
                    const ProgressMonitor& monitor,
                    const CancellationFlag& cancelFlag,
                    const retrieval::RetrievalOutcome& outcome);

    void completeTask(const TaskRecord& snapshot, const retrieval::RetrievedArtifact& artifact);
    void failTask(const TaskRecord& snapshot, const std::string& message);
    void cancelTask(const TaskRecord& snapshot, const std::string& message);

    /**
     * Wake waiters after a terminal transition
     */
    void notifyCompletion();

private:
    retrieval::RetrievalOperation m_retrieval;
    TaskDefaults m_defaults;
    ArtifactRemover m_remover;

    TaskRegistry m_registry;

    std::mutex m_workersMutex;
    std::unordered_map<std::string, std::thread> m_workers;
    std::atomic<bool> m_stopping{false};

    std::mutex m_waitMutex;
    std::condition_variable m_completionCondition;
    uint64_t m_completionGeneration{0};
};

} // namespace umedia::core::tasks
