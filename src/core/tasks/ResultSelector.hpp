#pragma once

/**
 * ResultSelector.hpp
 *
 * Picks the most plausible final artifact among the files a retrieval
 * produced, for normal completion fallback and partial-failure salvage.
 */

#include "TaskRecord.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace umedia::core::tasks {

/**
 * True for paths still carrying the in-progress ".part" suffix
 */
bool isPartialArtifact(const std::filesystem::path& path);

/**
 * Select the final artifact:
 * 1. drop ".part" files and files no longer on disk
 * 2. largest file with the preferred extension, if any
 * 3. otherwise the largest remaining file
 * 4. std::nullopt when nothing is left (a valid outcome)
 *
 * @param candidates Paths in production order
 * @param preferredExtension Extension without the dot, case-insensitive
 */
std::optional<TaskResult> selectPrimaryArtifact(const std::vector<std::string>& candidates,
                                                const std::string& preferredExtension);

} // namespace umedia::core::tasks
