/**
 * LocalFileRetrieval.cpp
 */

#include "LocalFileRetrieval.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathValidator.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <mutex>
#include <vector>

namespace umedia::core::retrieval {

using utils::FileUtils;

namespace {

// Serializes picking a free destination name and moving onto it
std::mutex g_placementMutex;

/**
 * First of "name.ext", "name (1).ext", "name (2).ext", ... not yet taken
 */
std::filesystem::path uniqueDestination(const std::filesystem::path& dir, const std::string& name) {
    std::filesystem::path candidate = dir / name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    std::filesystem::path base(name);
    std::string stem = base.stem().string();
    std::string extension = base.extension().string();
    for (int n = 1;; ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

} // namespace

LocalFileRetrieval::LocalFileRetrieval(std::filesystem::path downloadDir,
                                       std::filesystem::path tmpDir,
                                       size_t chunkSize)
    : m_downloadDir(std::move(downloadDir))
    , m_tmpDir(std::move(tmpDir))
    , m_chunkSize(chunkSize > 0 ? chunkSize : kDefaultChunkSize) {
}

RetrievalOutcome LocalFileRetrieval::operator()(const RetrievalRequest& request,
                                                const ProgressReporter& reporter) const {
    auto report = [&reporter](const ProgressEvent& event) {
        return !reporter || reporter(event);
    };

    std::filesystem::path source = FileUtils::fromFileUrl(request.parameters.url);
    if (source.empty() || !FileUtils::fileExists(source)) {
        return RetrievalFailed{"Source not found: " + request.parameters.url};
    }

    auto totalSize = FileUtils::getFileSize(source);
    if (!totalSize) {
        return RetrievalFailed{"Cannot read size of " + source.string()};
    }

    if (!FileUtils::createDirectories(m_tmpDir) || !FileUtils::createDirectories(m_downloadDir)) {
        return RetrievalFailed{"Cannot create output directories"};
    }

    std::string name = utils::sanitizeFilename(source.filename().string());
    // One temp file per task, so equal source names never share it
    std::string tempName = request.taskId.empty() ? name : request.taskId + "-" + name;
    std::filesystem::path tempPath = m_tmpDir / (tempName + ".part");

    ProgressEvent event;
    event.status = "downloading";
    event.transferredBytes = 0;
    event.totalBytes = static_cast<int64_t>(*totalSize);
    event.tempPath = tempPath;

    if (!report(event)) {
        return RetrievalCanceled{};
    }

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return RetrievalFailed{"Failed to open source file " + source.string()};
    }

    {
        std::ofstream output(tempPath, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            return RetrievalFailed{"Failed to open output file " + tempPath.string()};
        }

        std::vector<char> buffer(m_chunkSize);
        int64_t transferred = 0;

        while (input) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize count = input.gcount();
            if (count <= 0) {
                break;
            }

            output.write(buffer.data(), count);
            if (!output) {
                output.close();
                FileUtils::deleteFile(tempPath);
                return RetrievalFailed{"Write error on " + tempPath.string()};
            }

            transferred += count;
            event.transferredBytes = transferred;
            if (!report(event)) {
                output.close();
                FileUtils::deleteFile(tempPath);
                LOG_DEBUG("Transfer of {} stopped at {} bytes", source.string(), transferred);
                return RetrievalCanceled{};
            }
        }

        if (input.bad()) {
            output.close();
            FileUtils::deleteFile(tempPath);
            return RetrievalFailed{"Read error on " + source.string()};
        }
    }

    std::filesystem::path finalPath;
    {
        std::lock_guard<std::mutex> lock(g_placementMutex);
        finalPath = uniqueDestination(m_downloadDir, name);
        if (!FileUtils::moveFile(tempPath, finalPath)) {
            FileUtils::deleteFile(tempPath);
            return RetrievalFailed{"Failed to move " + tempPath.string() + " to " + finalPath.string()};
        }
    }

    ProgressEvent finished;
    finished.status = "finished";
    finished.transferredBytes = static_cast<int64_t>(*totalSize);
    finished.totalBytes = static_cast<int64_t>(*totalSize);
    finished.finalPath = finalPath;
    if (!report(finished)) {
        return RetrievalCanceled{};
    }

    LOG_DEBUG("Copied {} to {}", source.string(), finalPath.string());
    return RetrievedArtifact{finalPath, FileUtils::getFileSize(finalPath)};
}

} // namespace umedia::core::retrieval
