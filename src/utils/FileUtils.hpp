// umedia - File Utilities
// Error-code based file system operations

#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace umedia::utils {

/**
 * @brief File and directory utilities. None of these throw.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);
    static std::optional<uint64_t> getFileSize(const fs::path& path);
    static std::string getFileExtension(const fs::path& path); // lowercase, without the dot

    // Path utilities
    static fs::path normalizePath(const fs::path& path);
    static fs::path fromFileUrl(const std::string& locator);
};

} // namespace umedia::utils
