/**
 * ProgressMonitor.cpp
 */

#include "ProgressMonitor.hpp"
#include "ResultSelector.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <exception>
#include <initializer_list>

namespace umedia::core::tasks {

using retrieval::ProgressEvent;

std::optional<double> extractProgressPercent(const ProgressEvent& event) {
    if (event.status != "downloading") {
        return std::nullopt;
    }
    if (!event.transferredBytes) {
        return std::nullopt;
    }

    std::optional<int64_t> total = event.totalBytes;
    if (!total || *total <= 0) {
        total = event.totalBytesEstimate;
    }
    if (!total || *total <= 0) {
        return std::nullopt;
    }

    double percent = static_cast<double>(*event.transferredBytes) / static_cast<double>(*total) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

ProgressMonitor::ProgressMonitor(TaskRegistry& registry,
                                 std::string taskId,
                                 CancellationFlag cancelFlag,
                                 ArtifactRemover remover)
    : m_registry(registry)
    , m_taskId(std::move(taskId))
    , m_cancelFlag(std::move(cancelFlag))
    , m_remover(std::move(remover)) {
}

bool ProgressMonitor::operator()(const ProgressEvent& event) {
    if (isCancelRequested()) {
        cleanupPartialArtifacts(event);
        if (!m_cancelObserved.exchange(true)) {
            Logger::instance().debug("Task {} observed cancellation", m_taskId);
        }
        return false;
    }

    if (event.status == "finished" && event.finalPath) {
        m_registry.appendSideFile(m_taskId, event.finalPath->string());
    }

    auto percent = extractProgressPercent(event);
    if (percent) {
        TaskUpdate update;
        update.progress = std::min(kInFlightCeiling, *percent);
        m_registry.applyUpdate(m_taskId, update);
        return true;
    }

    if (event.status == "finished") {
        // One stage done, the job may still have post-processing ahead
        TaskUpdate update;
        update.progress = kInFlightCeiling;
        m_registry.applyUpdate(m_taskId, update);
    }
    return true;
}

retrieval::ProgressReporter ProgressMonitor::reporter() {
    return [this](const ProgressEvent& event) { return (*this)(event); };
}

bool ProgressMonitor::isCancelRequested() const {
    return m_cancelFlag && m_cancelFlag->load();
}

void ProgressMonitor::cleanupPartialArtifacts(const ProgressEvent& event) {
    if (!m_remover) {
        return;
    }

    for (const auto& candidate : {event.tempPath, event.finalPath}) {
        if (!candidate || !isPartialArtifact(*candidate)) {
            continue;
        }
        try {
            m_remover(*candidate);
        } catch (const std::exception& e) {
            Logger::instance().debug("Cleanup of {} failed: {}", candidate->string(), e.what());
        }
    }
}

} // namespace umedia::core::tasks
