#pragma once

/**
 * DownloadManager.hpp
 *
 * Runs one segmented download end to end:
 * probe, plan, resume, download, assemble, verify, clean up.
 */

#include "DownloadJob.hpp"
#include "DownloadError.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace parafetch::core::downloader {

class ResumeManager;

/**
 * Download request as given by the user
 */
struct DownloadOptions {
    std::string url;

    // Destination; empty = last URL path segment
    std::string output;

    // Bytes per chunk; empty = one chunk per worker
    std::optional<int64_t> chunkSize;

    int workers{8};
    int maxRetries{3};
    std::chrono::milliseconds retryDelay{1000};

    // Expected SHA-256 digest (optional)
    std::optional<std::string> sha256;

    bool resume{true};
    bool keepParts{false};
};

/**
 * Final result of a run
 */
struct DownloadOutcome {
    bool success{false};
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::string output;
    uint64_t bytes{0};
};

/**
 * Progress callback, invoked from worker threads
 */
using ProgressCallback = std::function<void(
    uint64_t bytesDownloaded,
    uint64_t totalBytes,
    size_t chunksCompleted,
    size_t chunkCount
)>;

/**
 * DownloadManager - single-resource segmented download
 */
class DownloadManager {
public:
    explicit DownloadManager(utils::HttpTransport& transport);
    ~DownloadManager() = default;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Run a download to completion; never throws for download failures
     * @param options Download request
     * @return Outcome with error code and message on failure
     */
    DownloadOutcome run(const DownloadOptions& options);

    /**
     * Request a stop. Lock-free, callable from a signal handler.
     * Part files stay on disk for the next run.
     */
    void cancel() { m_cancelled.store(true); }

    bool isCancelled() const { return m_cancelled.load(); }

    const ProgressCounters& counters() const { return m_counters; }

    void setProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }

    /**
     * Validate options before any network activity
     * @throws DownloadError (InvalidConfiguration)
     */
    static void validate(const DownloadOptions& options);

    /**
     * Output file name for a URL: its last path segment, or "download.bin"
     */
    static std::string deriveOutputName(const std::string& url);

private:
    void execute(const DownloadOptions& options, DownloadOutcome& outcome);

    void cleanupParts(const ResumeManager& parts, const std::vector<Chunk>& chunks, bool keepParts);

private:
    utils::HttpTransport& m_transport;
    ProgressCounters m_counters;
    std::atomic<bool> m_cancelled{false};
    ProgressCallback m_progressCallback;
};

} // namespace parafetch::core::downloader
