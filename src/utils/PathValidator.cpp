/**
 * PathValidator.cpp
 */

#include "PathValidator.hpp"
#include "FileUtils.hpp"

#include <cctype>
#include <stdexcept>

namespace umedia::utils {

PathValidator::PathValidator(const std::vector<fs::path>& allowedBaseDirs) {
    m_allowedBaseDirs.reserve(allowedBaseDirs.size());
    for (const auto& dir : allowedBaseDirs) {
        fs::path base = FileUtils::normalizePath(dir);
        // "/data/" -> "/data"
        if (base.filename().empty() && base.has_relative_path()) {
            base = base.parent_path();
        }
        m_allowedBaseDirs.push_back(base);
    }
}

bool PathValidator::isWithinAllowed(const fs::path& path) const {
    fs::path resolved = FileUtils::normalizePath(path);
    for (const auto& base : m_allowedBaseDirs) {
        if (isRelativeTo(resolved, base)) {
            return true;
        }
    }
    return false;
}

fs::path PathValidator::ensureWithinAllowed(const fs::path& path) const {
    fs::path resolved = FileUtils::normalizePath(path);
    for (const auto& base : m_allowedBaseDirs) {
        if (isRelativeTo(resolved, base)) {
            return resolved;
        }
    }
    throw std::invalid_argument("Path is outside allowed directories.");
}

bool PathValidator::safeUnlink(const fs::path& path) const {
    if (!isWithinAllowed(path)) {
        return false;
    }
    fs::path resolved = FileUtils::normalizePath(path);
    if (!FileUtils::fileExists(resolved)) {
        return false;
    }
    return FileUtils::deleteFile(resolved);
}

bool PathValidator::isRelativeTo(const fs::path& path, const fs::path& base) {
    auto baseIt = base.begin();
    auto pathIt = path.begin();
    for (; baseIt != base.end(); ++baseIt, ++pathIt) {
        if (pathIt == path.end() || *pathIt != *baseIt) {
            return false;
        }
    }
    return true;
}

std::string sanitizeFilename(const std::string& filename, size_t maxLength) {
    std::string cleaned;
    cleaned.reserve(filename.size());

    bool lastReplaced = false;
    for (unsigned char c : filename) {
        bool allowed = std::isalnum(c) || c == '.' || c == '_' || c == ' ' || c == '-';
        if (c == '/' || c == '\\') {
            cleaned += '_';
            lastReplaced = false;
        } else if (allowed) {
            cleaned += static_cast<char>(c);
            lastReplaced = false;
        } else if (!lastReplaced) {
            cleaned += '_';
            lastReplaced = true;
        }
    }

    auto start = cleaned.find_first_not_of(" ._");
    if (start == std::string::npos) {
        return "file";
    }
    auto end = cleaned.find_last_not_of(" ._");
    cleaned = cleaned.substr(start, end - start + 1);
    return cleaned.substr(0, maxLength);
}

} // namespace umedia::utils
