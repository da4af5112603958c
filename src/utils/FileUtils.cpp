/**
 * FileUtils.cpp
 *
 * Cross-platform file system operations.
 */

#include "FileUtils.hpp"
#include "StringUtils.hpp"

namespace umedia::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) { std::error_code ec; return fs::is_regular_file(path, ec); }

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) return true;

    // Cross-device: copy then remove
    ec.clear();
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) return false;
    fs::remove(source, ec);
    return true;
}

bool FileUtils::deleteFile(const fs::path& path) { std::error_code ec; return fs::remove(path, ec); }

std::optional<uint64_t> FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::string FileUtils::getFileExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return StringUtils::toLower(ext);
}

// -- Path utilities --

fs::path FileUtils::normalizePath(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) absolute = path;
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    return ec ? absolute.lexically_normal() : canonical;
}

fs::path FileUtils::fromFileUrl(const std::string& locator) {
    static const std::string scheme = "file://";
    if (StringUtils::startsWith(StringUtils::toLower(locator), scheme)) {
        return fs::path(locator.substr(scheme.size()));
    }
    return fs::path(locator);
}

} // namespace umedia::utils
