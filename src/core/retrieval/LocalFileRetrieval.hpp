#pragma once

/**
 * LocalFileRetrieval.hpp
 *
 * Retrieval operation for local sources ("/path" or "file:///path").
 * Copies the source in chunks through a ".part" file in the temporary
 * directory, then moves it into the download directory.
 */

#include "Retrieval.hpp"

#include <cstddef>
#include <filesystem>

namespace umedia::core::retrieval {

class LocalFileRetrieval {
public:
    static constexpr size_t kDefaultChunkSize = 64 * 1024;

    LocalFileRetrieval(std::filesystem::path downloadDir,
                       std::filesystem::path tmpDir,
                       size_t chunkSize = kDefaultChunkSize);

    /**
     * Run one transfer. Stops with RetrievalCanceled as soon as the
     * reporter returns false; the partial file is removed.
     */
    RetrievalOutcome operator()(const RetrievalRequest& request,
                                const ProgressReporter& reporter) const;

    const std::filesystem::path& downloadDir() const { return m_downloadDir; }
    const std::filesystem::path& tmpDir() const { return m_tmpDir; }

private:
    std::filesystem::path m_downloadDir;
    std::filesystem::path m_tmpDir;
    size_t m_chunkSize;
};

} // namespace umedia::core::retrieval
