#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace umedia::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getHomePath() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? fs::path(home) : fs::current_path();
    }

    static fs::path getConfigPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return (appData ? fs::path(appData) : getHomePath()) / "umedia" / "config.json";
#else
        return getHomePath() / ".config" / "umedia" / "config.json";
#endif
    }

    static fs::path getCachePath() {
        return getHomePath() / ".cache" / "umedia";
    }

    static fs::path getDefaultDownloadPath() {
        return getHomePath() / "Downloads" / "umedia";
    }

    static fs::path getDefaultTmpPath() {
        return getCachePath() / "tmp";
    }

    static fs::path getLogsPath() {
        return getCachePath() / "logs";
    }

    /**
     * Configured directory, or the fallback when the setting is empty.
     * A leading "~" is expanded to the home directory.
     */
    static fs::path resolveDirectory(const std::string& configured, const fs::path& fallback) {
        if (configured.empty()) {
            return fallback;
        }
        if (configured == "~") {
            return getHomePath();
        }
        if (configured.rfind("~/", 0) == 0) {
            return getHomePath() / configured.substr(2);
        }
        return fs::path(configured);
    }
};

} // namespace umedia::utils
