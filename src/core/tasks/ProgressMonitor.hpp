#pragma once

/**
 * ProgressMonitor.hpp
 *
 * Turns retrieval progress events into registry updates and is the single
 * point where cooperative cancellation is enforced.
 */

#include "TaskRegistry.hpp"
#include "../retrieval/Retrieval.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace umedia::core::tasks {

/**
 * Best-effort deletion of an incomplete artifact. May throw; errors are
 * ignored by the caller.
 */
using ArtifactRemover = std::function<void(const std::filesystem::path&)>;

/**
 * Percent for a determinate "downloading" event, clamped to [0, 100].
 * std::nullopt when the event carries no usable byte counts.
 */
std::optional<double> extractProgressPercent(const retrieval::ProgressEvent& event);

/**
 * ProgressMonitor
 *
 * Bound to one task. Invoked synchronously on the retrieval operation's
 * thread for every event. While the task is in flight progress is capped
 * at 99; 100 is only written by the terminal completed transition.
 */
class ProgressMonitor {
public:
    static constexpr double kInFlightCeiling = 99.0;

    ProgressMonitor(TaskRegistry& registry,
                    std::string taskId,
                    CancellationFlag cancelFlag,
                    ArtifactRemover remover = nullptr);

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    /**
     * Handle one event
     * @return false if the task is canceled and the operation must stop
     */
    bool operator()(const retrieval::ProgressEvent& event);

    /**
     * Reporter callable handed to the retrieval operation. Must not outlive
     * this monitor.
     */
    retrieval::ProgressReporter reporter();

    /**
     * True once the monitor has told the operation to stop
     */
    bool cancellationObserved() const { return m_cancelObserved.load(); }

private:
    bool isCancelRequested() const;
    void cleanupPartialArtifacts(const retrieval::ProgressEvent& event);

    TaskRegistry& m_registry;
    std::string m_taskId;
    CancellationFlag m_cancelFlag;
    ArtifactRemover m_remover;
    std::atomic<bool> m_cancelObserved{false};
};

} // namespace umedia::core::tasks
