#pragma once

/**
 * TaskRegistry.hpp
 *
 * Concurrency-safe map from task id to TaskRecord. Single source of truth
 * for status reads and writes.
 */

#include "TaskRecord.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace umedia::core::tasks {

/**
 * Shared cancellation signal. Written once by the registry, read wait-free
 * by the progress monitor.
 */
using CancellationFlag = std::shared_ptr<const std::atomic<bool>>;

/**
 * What a cancellation request did
 */
enum class CancelDisposition {
    NotFound,
    AlreadyTerminal,   // No-op, status reports the terminal state
    CanceledDirectly,  // No live worker, moved straight to canceled
    Requested          // Flag set, the live worker will observe it
};

struct CancelOutcome {
    CancelDisposition disposition;
    TaskStatus status;
};

/**
 * TaskRegistry
 *
 * One coarse mutex guards the id -> record map. It is held only for
 * bookkeeping, never while a retrieval operation runs. Records are never
 * evicted.
 */
class TaskRegistry {
public:
    TaskRegistry() = default;
    ~TaskRegistry() = default;

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Allocate a new record in pending state
     * @return Fresh, never reused task id
     */
    std::string create(const TaskParameters& parameters);

    /**
     * Snapshot of a record
     * @return std::nullopt for unknown ids
     */
    std::optional<TaskRecord> get(const std::string& taskId) const;

    /**
     * Records ordered newest first
     * @param statusFilter Exact, case-insensitive status match. Empty or
     *        absent means no filtering.
     */
    std::vector<TaskRecord> list(const std::optional<std::string>& statusFilter = std::nullopt) const;

    /**
     * Atomically merge the engaged fields of an update.
     * Rejected (returns false) for unknown ids, for records already in a
     * terminal state and for illegal status transitions.
     */
    bool applyUpdate(const std::string& taskId, const TaskUpdate& update);

    /**
     * pending -> running for the task's worker, progress reset to 0.
     * @return false if the task is unknown or no longer pending
     */
    bool beginRun(const std::string& taskId);

    /**
     * Set the cancellation flag. A task without a live worker goes straight
     * to canceled.
     */
    CancelOutcome requestCancel(const std::string& taskId);

    /**
     * @return nullptr for unknown ids
     */
    CancellationFlag cancellationFlag(const std::string& taskId) const;

    /**
     * Append a produced file, skipping duplicates
     * @return true if the path was added
     */
    bool appendSideFile(const std::string& taskId, const std::string& path);

    std::vector<std::string> sideFiles(const std::string& taskId) const;

    size_t size() const;

private:
    struct Entry {
        TaskRecord record;
        uint64_t sequence{0};
        bool live{false};
        std::shared_ptr<std::atomic<bool>> cancelFlag;
    };

    static void markTerminal(Entry& entry, TaskStatus status);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_tasks;
    uint64_t m_nextSequence{0};
};

} // namespace umedia::core::tasks
