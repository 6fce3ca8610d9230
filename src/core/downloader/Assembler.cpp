/**
 * Assembler.cpp
 */

#include "Assembler.hpp"
#include "DownloadError.hpp"
#include "ResumeManager.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <fstream>

namespace parafetch::core::downloader {

Assembler::Assembler(const ResumeManager& parts)
    : m_parts(parts) {
}

uint64_t Assembler::assemble(const DownloadJob& job, const std::vector<Chunk>& chunks) const {
    if (!job.totalSize) {
        throw DownloadError(ErrorCode::SizeUnknown, "cannot assemble a resource of unknown size");
    }

    std::vector<const Chunk*> ordered;
    ordered.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ordered.push_back(&chunk);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Chunk* a, const Chunk* b) { return a->index < b->index; });

    // Everything must be on disk before the output is touched
    for (const Chunk* chunk : ordered) {
        if (chunk->state != ChunkState::Completed) {
            throw DownloadError(ErrorCode::AssemblyIncomplete,
                                "chunk " + std::to_string(chunk->index) + " is " + chunkStateName(chunk->state));
        }
        PartFile part = m_parts.inspect(*chunk);
        if (!part.isComplete()) {
            throw DownloadError(ErrorCode::AssemblyIncomplete,
                                "part file " + part.path + " holds " +
                                std::to_string(part.actualLength.value_or(0)) + " of " +
                                std::to_string(part.expectedLength) + " bytes");
        }
    }

    fs::path output(job.output);
    if (output.has_parent_path() && !utils::FileUtils::createDirectories(output.parent_path())) {
        throw DownloadError(ErrorCode::IoError, "cannot create directory " + output.parent_path().string());
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw DownloadError(ErrorCode::IoError, "cannot open output file " + job.output);
    }

    std::vector<char> buffer(kBufferSize);
    uint64_t written = 0;

    for (const Chunk* chunk : ordered) {
        fs::path partPath = m_parts.partPath(*chunk);
        std::ifstream in(partPath, std::ios::binary);
        if (!in.is_open()) {
            throw DownloadError(ErrorCode::IoError, "cannot open part file " + partPath.string());
        }

        while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
            out.write(buffer.data(), in.gcount());
            if (!out) {
                throw DownloadError(ErrorCode::IoError, "write to " + job.output + " failed");
            }
            written += static_cast<uint64_t>(in.gcount());
        }
        if (in.bad()) {
            throw DownloadError(ErrorCode::IoError, "read from " + partPath.string() + " failed");
        }
    }

    out.close();
    if (out.fail()) {
        throw DownloadError(ErrorCode::IoError, "closing " + job.output + " failed");
    }

    int64_t onDisk = utils::FileUtils::getFileSize(output);
    if (onDisk < 0 || static_cast<uint64_t>(onDisk) != *job.totalSize) {
        throw DownloadError(ErrorCode::SizeMismatch,
                            "output is " + std::to_string(onDisk) + " bytes, expected " +
                            std::to_string(*job.totalSize));
    }

    LOG_DEBUG("Assembled {} part(s) into {} ({} bytes)", ordered.size(), job.output, written);
    return written;
}

} // namespace parafetch::core::downloader
