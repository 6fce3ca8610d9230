/**
 * ChunkPlanner.cpp
 */

#include "ChunkPlanner.hpp"
#include "DownloadError.hpp"

#include <algorithm>
#include <limits>

namespace parafetch::core::downloader {

size_t ChunkPlanner::chunkCount(uint64_t totalSize, uint64_t chunkSize) {
    if (totalSize == 0 || chunkSize == 0) return 0;
    return static_cast<size_t>(totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0));
}

int64_t ChunkPlanner::autoChunkSize(uint64_t totalSize, int workers) {
    if (workers <= 0) {
        throw DownloadError(ErrorCode::InvalidConfiguration,
                            "worker count must be positive, got " + std::to_string(workers));
    }
    if (totalSize == 0) return 1;

    uint64_t n = static_cast<uint64_t>(workers);
    uint64_t perWorker = totalSize / n + (totalSize % n != 0 ? 1 : 0);

    // Larger totals simply get more chunks than workers
    return static_cast<int64_t>(std::min<uint64_t>(perWorker, std::numeric_limits<int64_t>::max()));
}

ChunkPlan ChunkPlanner::plan(uint64_t totalSize, int64_t chunkSize, int workers) {
    if (chunkSize <= 0) {
        throw DownloadError(ErrorCode::InvalidConfiguration,
                            "chunk size must be positive, got " + std::to_string(chunkSize));
    }
    if (workers <= 0) {
        throw DownloadError(ErrorCode::InvalidConfiguration,
                            "worker count must be positive, got " + std::to_string(workers));
    }

    ChunkPlan result;
    result.chunkSize = static_cast<uint64_t>(chunkSize);

    size_t count = chunkCount(totalSize, result.chunkSize);
    result.chunks.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.index = i;
        chunk.start = static_cast<uint64_t>(i) * result.chunkSize;
        chunk.end = chunk.start + std::min(result.chunkSize, totalSize - chunk.start) - 1;
        result.chunks.push_back(chunk);
    }

    result.workers = static_cast<int>(std::min<size_t>(static_cast<size_t>(workers), count));
    return result;
}

ChunkPlan ChunkPlanner::planSingle(uint64_t totalSize) {
    ChunkPlan result;
    result.chunkSize = totalSize;

    if (totalSize > 0) {
        Chunk chunk;
        chunk.index = 0;
        chunk.start = 0;
        chunk.end = totalSize - 1;
        result.chunks.push_back(chunk);
        result.workers = 1;
    }
    return result;
}

} // namespace parafetch::core::downloader
