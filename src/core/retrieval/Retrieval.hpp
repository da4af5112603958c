#pragma once

/**
 * Retrieval.hpp
 *
 * Contract between the task core and a retrieval operation (the component
 * that actually transfers media). The core only sees progress events and a
 * tagged outcome.
 */

#include "../tasks/TaskParameters.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace umedia::core::retrieval {

/**
 * One progress notification pushed by a retrieval operation.
 * status is "downloading", "finished" or anything else (ignored).
 */
struct ProgressEvent {
    std::string status;
    std::optional<int64_t> transferredBytes;
    std::optional<int64_t> totalBytes;
    std::optional<int64_t> totalBytesEstimate;
    std::optional<std::filesystem::path> tempPath;
    std::optional<std::filesystem::path> finalPath;
};

/**
 * Progress callback handed to the operation.
 * Returns false when the task has been canceled; the operation must then
 * stop and return RetrievalCanceled.
 */
using ProgressReporter = std::function<bool(const ProgressEvent&)>;

/**
 * Immutable snapshot of what to retrieve
 */
struct RetrievalRequest {
    std::string taskId;
    tasks::TaskParameters parameters;
};

/**
 * Successful transfer. An empty path means "look at the produced files".
 */
struct RetrievedArtifact {
    std::filesystem::path path;
    std::optional<uint64_t> size;
};

struct RetrievalCanceled {
    std::string message{"Canceled by user."};
};

struct RetrievalFailed {
    std::string message;
};

using RetrievalOutcome = std::variant<RetrievedArtifact, RetrievalCanceled, RetrievalFailed>;

/**
 * The operation itself. May also throw; anything thrown is treated as
 * RetrievalFailed.
 */
using RetrievalOperation = std::function<RetrievalOutcome(const RetrievalRequest&, const ProgressReporter&)>;

} // namespace umedia::core::retrieval
