#pragma once

/**
 * ChunkPlanner.hpp
 *
 * Splits a resource of known size into ordered byte-range chunks.
 */

#include "DownloadJob.hpp"

#include <cstdint>
#include <vector>

namespace parafetch::core::downloader {

/**
 * Result of planning: chunks ordered by index plus the effective concurrency
 */
struct ChunkPlan {
    std::vector<Chunk> chunks;
    uint64_t chunkSize{0};
    int workers{0};
};

class ChunkPlanner {
public:
    /**
     * Partition [0, totalSize-1] into ceil(totalSize / chunkSize) ranges
     * @param totalSize Resource size in bytes
     * @param chunkSize Bytes per chunk, the last chunk may be shorter
     * @param workers Requested worker count
     * @return Plan; workers is min(workers, chunk count)
     * @throws DownloadError (InvalidConfiguration) when chunkSize or workers is not positive
     */
    static ChunkPlan plan(uint64_t totalSize, int64_t chunkSize, int workers);

    /**
     * Plan for servers without range support: one chunk, one worker
     */
    static ChunkPlan planSingle(uint64_t totalSize);

    /**
     * Chunk size used when none is configured: one chunk per worker
     * @throws DownloadError (InvalidConfiguration) when workers is not positive
     */
    static int64_t autoChunkSize(uint64_t totalSize, int workers);

    static size_t chunkCount(uint64_t totalSize, uint64_t chunkSize);
};

} // namespace parafetch::core::downloader
