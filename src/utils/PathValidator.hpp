// umedia - Path Validator
// Keeps file deletion inside the download and temporary directories

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace umedia::utils {

namespace fs = std::filesystem;

/**
 * @brief Validates that paths stay within allowed base directories
 */
class PathValidator {
public:
    explicit PathValidator(const std::vector<fs::path>& allowedBaseDirs);

    const std::vector<fs::path>& allowedBaseDirs() const { return m_allowedBaseDirs; }

    bool isWithinAllowed(const fs::path& path) const;

    /**
     * Resolve a path and check it against the allowed directories
     * @throws std::invalid_argument if the path is outside all of them
     */
    fs::path ensureWithinAllowed(const fs::path& path) const;

    /**
     * Delete a regular file if it is inside an allowed directory
     * @return true if a file was removed
     */
    bool safeUnlink(const fs::path& path) const;

private:
    static bool isRelativeTo(const fs::path& path, const fs::path& base);

    std::vector<fs::path> m_allowedBaseDirs;
};

/**
 * Filesystem-safe file name without path separators
 */
std::string sanitizeFilename(const std::string& filename, size_t maxLength = 128);

} // namespace umedia::utils
