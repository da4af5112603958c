#pragma once

/**
 * TaskParameters.hpp
 *
 * Immutable job parameters and their normalization.
 */

#include <optional>
#include <stdexcept>
#include <string>

namespace umedia::core {
class Config;
}

namespace umedia::core::tasks {

/**
 * Media kinds accepted by the task core
 */
enum class MediaKind {
    Video,
    Audio
};

const char* toString(MediaKind kind);

/**
 * Case-insensitive, whitespace tolerant
 */
std::optional<MediaKind> parseMediaKind(const std::string& name);

/**
 * Raw request as received from a caller
 */
struct DownloadRequest {
    std::string url;
    std::string mediaKind{"video"};
    std::string quality{"best"};
    std::string format;
};

/**
 * Validated job specification, fixed at creation
 */
struct TaskParameters {
    std::string url;
    MediaKind mediaKind{MediaKind::Video};
    std::string quality;
    std::optional<std::string> format;
};

/**
 * Defaults applied during normalization
 */
struct TaskDefaults {
    std::string videoQuality{"best"};
    std::string audioFormat{"mp3"};
    std::string audioQuality{"192"};
    int pollIntervalSeconds{2};

    static TaskDefaults fromConfig(const Config& config);
};

/**
 * Rejected request parameters. No task is created.
 */
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Validate the media kind and fill quality/format defaults per kind.
 * @throws ValidationError for an unsupported media kind
 */
TaskParameters normalizeParameters(const DownloadRequest& request, const TaskDefaults& defaults);

/**
 * Container extension (without dot) a finished job of this kind should have
 */
std::string preferredContainer(const TaskParameters& parameters);

} // namespace umedia::core::tasks
