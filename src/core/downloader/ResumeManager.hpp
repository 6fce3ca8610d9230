#pragma once

/**
 * ResumeManager.hpp
 *
 * Part-file bookkeeping between runs.
 *
 * Layout for an output file "out.iso":
 *   out.iso.parts/manifest.json
 *   out.iso.parts/chunk-00000-0-1048575.part
 *   out.iso.parts/chunk-00001-1048576-2097151.part
 *   ...
 */

#include "DownloadJob.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace parafetch::core::downloader {

namespace fs = std::filesystem;
using json = nlohmann::json;

/**
 * Part file classification
 */
enum class PartStatus {
    Complete,   // Exact expected length
    Partial,    // Shorter or longer than expected
    Absent
};

/**
 * Outcome of reconciling a plan with the part files on disk
 */
struct ResumePlan {
    std::vector<size_t> pending;    // Chunk indices still to fetch, ascending
    size_t completeCount{0};
    uint64_t completeBytes{0};
    size_t discardedCount{0};       // Partial part files removed
};

class ResumeManager {
public:
    explicit ResumeManager(const std::string& output);

    const fs::path& partsDirectory() const { return m_partsDir; }
    fs::path manifestPath() const;
    fs::path partPath(const Chunk& chunk) const;

    static std::string partFileName(const Chunk& chunk);

    PartFile inspect(const Chunk& chunk) const;
    static PartStatus classify(const PartFile& part);

    /**
     * Mark chunks with complete part files Completed, delete partial ones
     * @param chunks Planned chunks, all Pending
     * @return Indices still to download plus what was already on disk
     */
    ResumePlan reconcile(std::vector<Chunk>& chunks) const;

    /**
     * Make the parts directory ready for a job
     *
     * Existing part files are discarded when resume is off, when the manifest
     * cannot be read, or when it describes a different job. The manifest is
     * then rewritten for the current job.
     * @throws DownloadError (IoError) when the directory or manifest cannot be written
     */
    void prepare(const DownloadJob& job, size_t chunkCount, bool resume);

    static json buildManifest(const DownloadJob& job, size_t chunkCount);

    /**
     * Compare a stored manifest with the current job.
     * Validators (ETag, Last-Modified) only count when both sides carry one.
     */
    static bool manifestMatches(const json& manifest, const DownloadJob& job, size_t chunkCount);

    /**
     * Remove every part file and the manifest
     * @return Number of files removed
     */
    size_t discardAll() const;

    /**
     * Remove the given chunks' part files, the manifest and the directory if empty.
     * Failures are logged as warnings.
     * @return Number of files that could not be removed
     */
    size_t cleanup(const std::vector<Chunk>& chunks) const;

private:
    fs::path m_partsDir;
};

} // namespace parafetch::core::downloader
