/**
 * DownloadManager.cpp
 *
 * Implementation of the segmented download pipeline.
 */

#include "DownloadManager.hpp"
#include "Assembler.hpp"
#include "CapabilityProber.hpp"
#include "ChunkPlanner.hpp"
#include "DownloadScheduler.hpp"
#include "IntegrityVerifier.hpp"
#include "ResumeManager.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <filesystem>
#include <sstream>

namespace parafetch::core::downloader {

using utils::StringUtils;

namespace {

std::string joinIndices(const std::vector<size_t>& indices, size_t limit = 10) {
    std::ostringstream oss;
    for (size_t i = 0; i < indices.size() && i < limit; ++i) {
        if (i > 0) oss << ", ";
        oss << indices[i];
    }
    if (indices.size() > limit) oss << ", ...";
    return oss.str();
}

} // namespace

DownloadManager::DownloadManager(utils::HttpTransport& transport)
    : m_transport(transport) {
}

DownloadOutcome DownloadManager::run(const DownloadOptions& options) {
    DownloadOutcome outcome;
    outcome.output = options.output;

    try {
        execute(options, outcome);
        outcome.success = true;
        outcome.code = ErrorCode::None;

    } catch (const DownloadError& e) {
        outcome.success = false;
        outcome.code = e.code();
        outcome.message = e.what();

    } catch (const std::filesystem::filesystem_error& e) {
        outcome.success = false;
        outcome.code = ErrorCode::IoError;
        outcome.message = e.what();
    }

    if (outcome.success) {
        LOG_INFO("Done: {} ({})", outcome.output, StringUtils::formatBytes(outcome.bytes));
    } else if (outcome.code == ErrorCode::Cancelled) {
        LOG_WARN("Download interrupted: {}", outcome.message);
    } else {
        LOG_ERROR("Download failed ({}): {}", errorCodeLabel(outcome.code), outcome.message);
    }

    return outcome;
}

void DownloadManager::validate(const DownloadOptions& options) {
    auto invalid = [](const std::string& message) {
        return DownloadError(ErrorCode::InvalidConfiguration, message);
    };

    if (!StringUtils::isUrl(options.url)) {
        throw invalid("URL must start with http:// or https://: '" + options.url + "'");
    }
    if (options.workers <= 0) {
        throw invalid("worker count must be positive, got " + std::to_string(options.workers));
    }
    if (options.chunkSize && *options.chunkSize <= 0) {
        throw invalid("chunk size must be positive, got " + std::to_string(*options.chunkSize));
    }
    if (options.maxRetries < 0) {
        throw invalid("retry limit must not be negative, got " + std::to_string(options.maxRetries));
    }
    if (options.retryDelay.count() < 0) {
        throw invalid("retry delay must not be negative");
    }
    if (options.sha256 && !IntegrityVerifier::isValidDigest(*options.sha256)) {
        throw invalid("SHA-256 digest must be 64 hex characters: '" + *options.sha256 + "'");
    }
}

std::string DownloadManager::deriveOutputName(const std::string& url) {
    std::string path = url;

    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path = path.substr(0, cut);
    }

    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }

    auto lastSlash = path.rfind('/');
    std::string name = lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
    name = StringUtils::sanitizeFileName(name);

    if (name.empty() || name == "." || name == "..") {
        return "download.bin";
    }
    return name;
}

void DownloadManager::execute(const DownloadOptions& options, DownloadOutcome& outcome) {
    validate(options);
    m_counters.reset();

    if (m_cancelled.load()) {
        throw DownloadError(ErrorCode::Cancelled, "stopped before start");
    }

    // -- Probe --

    LOG_INFO("Probing {}", options.url);
    CapabilityProber prober(m_transport);
    ResourceInfo info = prober.probe(options.url, &m_cancelled);

    if (!info.totalSize) {
        throw DownloadError(ErrorCode::SizeUnknown, "server did not report the size of " + info.finalUrl);
    }
    if (info.finalUrl != options.url) {
        LOG_INFO("Redirected to {}", info.finalUrl);
    }

    DownloadJob job;
    job.url = info.finalUrl;
    job.output = options.output.empty() ? deriveOutputName(info.finalUrl) : options.output;
    job.totalSize = info.totalSize;
    job.rangesSupported = info.rangesSupported;
    job.sha256 = options.sha256;
    job.etag = info.etag;
    job.lastModified = info.lastModified;

    outcome.output = job.output;
    const uint64_t total = *job.totalSize;

    // -- Plan --

    ChunkPlan plan;
    if (!job.rangesSupported) {
        LOG_WARN("Server does not support byte ranges, downloading with a single connection");
        plan = ChunkPlanner::planSingle(total);
    } else {
        int64_t chunkSize = options.chunkSize ? *options.chunkSize
                                              : ChunkPlanner::autoChunkSize(total, options.workers);
        plan = ChunkPlanner::plan(total, chunkSize, options.workers);
    }

    job.chunkSize = plan.chunkSize;
    job.workers = plan.workers;
    std::vector<Chunk>& chunks = plan.chunks;

    LOG_INFO("Size: {} ({} bytes) | Ranges: {}", StringUtils::formatBytes(total), total,
             job.rangesSupported ? "yes" : "no");
    LOG_INFO("Chunks: {} | Chunk size: {} | Workers: {}", chunks.size(),
             StringUtils::formatBytes(job.chunkSize), job.workers);

    ResumeManager parts(job.output);
    Assembler assembler(parts);

    if (chunks.empty()) {
        outcome.bytes = assembler.assemble(job, chunks);
        IntegrityVerifier::verify(job.output, job.sha256);
        return;
    }

    // -- Resume --

    parts.prepare(job, chunks.size(), options.resume);
    ResumePlan resume = parts.reconcile(chunks);

    if (resume.completeCount > 0) {
        LOG_INFO("Resuming: {} of {} chunk(s) already complete ({})", resume.completeCount, chunks.size(),
                 StringUtils::formatBytes(resume.completeBytes));
    }
    if (resume.discardedCount > 0) {
        LOG_INFO("Discarded {} partial chunk(s)", resume.discardedCount);
    }

    m_counters.addBytes(resume.completeBytes);
    for (size_t i = 0; i < resume.completeCount; ++i) {
        m_counters.chunkCompleted();
    }

    // -- Download --

    DownloadScheduler scheduler(m_transport, parts, m_counters, m_cancelled);
    const size_t chunkCount = chunks.size();

    scheduler.setChunkCallback([this, total, chunkCount](const Chunk& chunk) {
        if (chunk.state != ChunkState::Completed) return;

        uint64_t bytes = m_counters.bytes();
        size_t completed = m_counters.completed();
        double fraction = total > 0 ? static_cast<double>(bytes) / static_cast<double>(total) : 1.0;

        LOG_INFO("Chunk {} done ({}/{}) {}", chunk.index, completed, chunkCount,
                 StringUtils::formatPercentage(fraction));

        if (m_progressCallback) {
            m_progressCallback(bytes, total, completed, chunkCount);
        }
    });

    SchedulerOptions schedulerOptions;
    schedulerOptions.workers = job.workers;
    schedulerOptions.maxRetries = options.maxRetries;
    schedulerOptions.retryDelay = options.retryDelay;

    SchedulerResult result = scheduler.run(job, chunks, resume.pending, schedulerOptions);

    if (result.cancelled) {
        throw DownloadError(ErrorCode::Cancelled,
                            std::to_string(result.completed) + " of " + std::to_string(chunkCount) +
                            " chunk(s) complete, run again to resume");
    }

    if (!result.aborted.empty()) {
        const Chunk& first = chunks[result.aborted.front()];
        throw DownloadError(ErrorCode::DownloadFailed,
                            std::to_string(result.aborted.size()) + " chunk(s) failed [" +
                            joinIndices(result.aborted) + "], chunk " + std::to_string(first.index) +
                            ": " + first.lastError);
    }

    // -- Assemble, verify, clean up --

    outcome.bytes = assembler.assemble(job, chunks);

    try {
        std::string digest = IntegrityVerifier::verify(job.output, job.sha256);
        if (!digest.empty()) {
            LOG_INFO("SHA-256 OK: {}", digest);
        }
    } catch (const DownloadError& e) {
        if (e.code() == ErrorCode::IntegrityMismatch) {
            cleanupParts(parts, chunks, options.keepParts);
        }
        throw;
    }

    cleanupParts(parts, chunks, options.keepParts);
}

void DownloadManager::cleanupParts(const ResumeManager& parts, const std::vector<Chunk>& chunks, bool keepParts) {
    if (keepParts) {
        LOG_INFO("Keeping part files in {}", parts.partsDirectory().string());
        return;
    }

    size_t failures = parts.cleanup(chunks);
    if (failures > 0) {
        LOG_WARN("{} part file(s) could not be removed", failures);
    }
}

} // namespace parafetch::core::downloader
