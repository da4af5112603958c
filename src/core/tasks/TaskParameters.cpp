/**
 * TaskParameters.cpp
 */

#include "TaskParameters.hpp"
#include "../Config.hpp"
#include "../../utils/StringUtils.hpp"

namespace umedia::core::tasks {

using utils::StringUtils;

const char* toString(MediaKind kind) {
    switch (kind) {
        case MediaKind::Video: return "video";
        case MediaKind::Audio: return "audio";
    }
    return "video";
}

std::optional<MediaKind> parseMediaKind(const std::string& name) {
    std::string normalized = StringUtils::toLower(StringUtils::trim(name));
    if (normalized == "video") return MediaKind::Video;
    if (normalized == "audio") return MediaKind::Audio;
    return std::nullopt;
}

TaskDefaults TaskDefaults::fromConfig(const Config& config) {
    TaskDefaults defaults;
    defaults.videoQuality = config.get<std::string>("downloads.defaultVideoQuality", defaults.videoQuality);
    defaults.audioFormat = config.get<std::string>("downloads.defaultAudioFormat", defaults.audioFormat);
    defaults.audioQuality = config.get<std::string>("downloads.defaultAudioQuality", defaults.audioQuality);
    defaults.pollIntervalSeconds = config.get<int>("downloads.pollIntervalSeconds", defaults.pollIntervalSeconds);
    return defaults;
}

TaskParameters normalizeParameters(const DownloadRequest& request, const TaskDefaults& defaults) {
    std::string kindName = StringUtils::trim(request.mediaKind);
    if (kindName.empty()) {
        kindName = "video";
    }

    auto kind = parseMediaKind(kindName);
    if (!kind) {
        throw ValidationError("Unsupported media_type. Expected one of: video, audio");
    }

    TaskParameters parameters;
    parameters.url = request.url;
    parameters.mediaKind = *kind;

    std::string quality = StringUtils::trim(request.quality);
    std::string format = StringUtils::toLower(StringUtils::trim(request.format));

    if (*kind == MediaKind::Video) {
        if (quality.empty()) {
            quality = defaults.videoQuality;
        }
    } else {
        // Audio quality is a bitrate in kbps
        if (!StringUtils::isNumeric(quality)) {
            quality = defaults.audioQuality;
        }
        if (format.empty()) {
            format = StringUtils::toLower(defaults.audioFormat);
        }
    }

    parameters.quality = quality;
    if (!format.empty()) {
        parameters.format = format;
    }
    return parameters;
}

std::string preferredContainer(const TaskParameters& parameters) {
    if (parameters.mediaKind == MediaKind::Audio && parameters.format) {
        return *parameters.format;
    }
    return parameters.mediaKind == MediaKind::Audio ? "mp3" : "mp4";
}

} // namespace umedia::core::tasks
