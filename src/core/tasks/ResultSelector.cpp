/**
 * ResultSelector.cpp
 */

#include "ResultSelector.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace umedia::core::tasks {

using utils::FileUtils;

bool isPartialArtifact(const std::filesystem::path& path) {
    return path.extension() == ".part";
}

std::optional<TaskResult> selectPrimaryArtifact(const std::vector<std::string>& candidates,
                                                const std::string& preferredExtension) {
    const std::string preferred = utils::StringUtils::toLower(preferredExtension);

    std::optional<TaskResult> bestPreferred;
    std::optional<TaskResult> bestAny;

    for (const auto& candidate : candidates) {
        std::filesystem::path path(candidate);
        if (isPartialArtifact(path) || !FileUtils::fileExists(path)) {
            continue;
        }

        auto size = FileUtils::getFileSize(path);
        if (!size) {
            continue;
        }

        // Strictly larger, so the first of equal-sized files wins
        if (!bestAny || *size > *bestAny->size) {
            bestAny = TaskResult{path, size};
        }
        if (!preferred.empty() && FileUtils::getFileExtension(path) == preferred) {
            if (!bestPreferred || *size > *bestPreferred->size) {
                bestPreferred = TaskResult{path, size};
            }
        }
    }

    return bestPreferred ? bestPreferred : bestAny;
}

} // namespace umedia::core::tasks
