/**
 * ResumeManager.cpp
 */

#include "ResumeManager.hpp"
#include "DownloadError.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"

#include <iomanip>
#include <sstream>

namespace parafetch::core::downloader {

using utils::FileUtils;
using utils::JsonUtils;

namespace {
constexpr const char* kManifestName = "manifest.json";
constexpr const char* kPartExtension = ".part";
constexpr int kManifestVersion = 1;
}

ResumeManager::ResumeManager(const std::string& output)
    : m_partsDir(output + ".parts") {
}

fs::path ResumeManager::manifestPath() const {
    return m_partsDir / kManifestName;
}

std::string ResumeManager::partFileName(const Chunk& chunk) {
    std::ostringstream name;
    name << "chunk-" << std::setw(5) << std::setfill('0') << chunk.index
         << '-' << chunk.start << '-' << chunk.end << kPartExtension;
    return name.str();
}

fs::path ResumeManager::partPath(const Chunk& chunk) const {
    return m_partsDir / partFileName(chunk);
}

PartFile ResumeManager::inspect(const Chunk& chunk) const {
    PartFile part;
    part.path = partPath(chunk).string();
    part.expectedLength = chunk.length();

    int64_t size = FileUtils::getFileSize(part.path);
    if (size >= 0) {
        part.actualLength = static_cast<uint64_t>(size);
    }
    return part;
}

PartStatus ResumeManager::classify(const PartFile& part) {
    if (!part.exists()) return PartStatus::Absent;
    return part.isComplete() ? PartStatus::Complete : PartStatus::Partial;
}

ResumePlan ResumeManager::reconcile(std::vector<Chunk>& chunks) const {
    ResumePlan plan;

    for (auto& chunk : chunks) {
        PartFile part = inspect(chunk);

        switch (classify(part)) {
            case PartStatus::Complete:
                chunk.advance(ChunkState::Completed);
                ++plan.completeCount;
                plan.completeBytes += part.expectedLength;
                break;

            case PartStatus::Partial:
                LOG_DEBUG("Discarding partial part {} ({} of {} bytes)",
                          part.path, *part.actualLength, part.expectedLength);
                if (!FileUtils::deleteFile(part.path)) {
                    // The worker truncates it on open anyway
                    LOG_WARN("Could not remove partial part file {}", part.path);
                }
                ++plan.discardedCount;
                plan.pending.push_back(chunk.index);
                break;

            case PartStatus::Absent:
                plan.pending.push_back(chunk.index);
                break;
        }
    }

    return plan;
}

json ResumeManager::buildManifest(const DownloadJob& job, size_t chunkCount) {
    return {
        {"version", kManifestVersion},
        {"url", job.url},
        {"size", job.totalSize.value_or(0)},
        {"chunkSize", job.chunkSize},
        {"chunkCount", chunkCount},
        {"rangesSupported", job.rangesSupported},
        {"etag", job.etag},
        {"lastModified", job.lastModified}
    };
}

bool ResumeManager::manifestMatches(const json& manifest, const DownloadJob& job, size_t chunkCount) {
    if (!manifest.is_object()) return false;

    if (JsonUtils::getString(manifest, "url") != job.url) return false;
    if (JsonUtils::getLong(manifest, "size", -1) != static_cast<int64_t>(job.totalSize.value_or(0))) return false;
    if (JsonUtils::getLong(manifest, "chunkSize", -1) != static_cast<int64_t>(job.chunkSize)) return false;
    if (JsonUtils::getLong(manifest, "chunkCount", -1) != static_cast<int64_t>(chunkCount)) return false;
    if (JsonUtils::getBool(manifest, "rangesSupported", !job.rangesSupported) != job.rangesSupported) return false;

    std::string etag = JsonUtils::getString(manifest, "etag");
    if (!etag.empty() && !job.etag.empty() && etag != job.etag) return false;

    std::string lastModified = JsonUtils::getString(manifest, "lastModified");
    if (!lastModified.empty() && !job.lastModified.empty() && lastModified != job.lastModified) return false;

    return true;
}

void ResumeManager::prepare(const DownloadJob& job, size_t chunkCount, bool resume) {
    if (!resume) {
        size_t removed = discardAll();
        if (removed > 0) {
            LOG_INFO("Resume disabled, discarded {} existing part file(s)", removed);
        }
    } else if (FileUtils::fileExists(manifestPath())) {
        auto stored = JsonUtils::parseFile(manifestPath());
        if (!stored) {
            size_t removed = discardAll();
            LOG_WARN("Unreadable resume manifest, discarded {} part file(s)", removed);
        } else if (!manifestMatches(*stored, job, chunkCount)) {
            size_t removed = discardAll();
            LOG_INFO("Existing parts belong to a different download, discarded {} file(s)", removed);
        }
    }

    if (!FileUtils::createDirectories(m_partsDir)) {
        throw DownloadError(ErrorCode::IoError, "cannot create parts directory " + m_partsDir.string());
    }

    if (!JsonUtils::writeFileAtomic(manifestPath(), buildManifest(job, chunkCount))) {
        throw DownloadError(ErrorCode::IoError, "cannot write resume manifest " + manifestPath().string());
    }
}

size_t ResumeManager::discardAll() const {
    size_t removed = 0;
    for (const auto& file : FileUtils::listFiles(m_partsDir, kPartExtension)) {
        if (FileUtils::deleteFile(file)) {
            ++removed;
        } else {
            LOG_WARN("Could not remove part file {}", file.string());
        }
    }
    if (FileUtils::fileExists(manifestPath()) && !FileUtils::deleteFile(manifestPath())) {
        LOG_WARN("Could not remove resume manifest {}", manifestPath().string());
    }
    return removed;
}

size_t ResumeManager::cleanup(const std::vector<Chunk>& chunks) const {
    size_t failures = 0;

    // Anything left at a part or manifest path counts, not just regular files
    auto present = [](const fs::path& path) {
        std::error_code ec;
        return fs::exists(fs::symlink_status(path, ec));
    };

    for (const auto& chunk : chunks) {
        fs::path part = partPath(chunk);
        if (present(part) && !FileUtils::deleteFile(part)) {
            LOG_WARN("Could not remove part file {}", part.string());
            ++failures;
        }
    }

    if (present(manifestPath()) && !FileUtils::deleteFile(manifestPath())) {
        LOG_WARN("Could not remove resume manifest {}", manifestPath().string());
        ++failures;
    }

    std::error_code ec;
    if (fs::is_directory(m_partsDir, ec) && !FileUtils::removeDirectoryIfEmpty(m_partsDir)) {
        LOG_WARN("Parts directory {} is not empty, leaving it in place", m_partsDir.string());
    }

    return failures;
}

} // namespace parafetch::core::downloader
