#pragma once

/**
 * Assembler.hpp
 *
 * Concatenates complete part files into the output file in index order.
 */

#include "DownloadJob.hpp"

#include <cstdint>
#include <vector>

namespace parafetch::core::downloader {

class ResumeManager;

class Assembler {
public:
    static constexpr size_t kBufferSize = 128 * 1024;

    explicit Assembler(const ResumeManager& parts);

    /**
     * Write the output file
     * @param job Job descriptor (output path, total size)
     * @param chunks Every planned chunk
     * @return Bytes written
     * @throws DownloadError AssemblyIncomplete when a chunk or its part file is not complete,
     *         IoError on read/write failures, SizeMismatch when the result has the wrong length
     */
    uint64_t assemble(const DownloadJob& job, const std::vector<Chunk>& chunks) const;

private:
    const ResumeManager& m_parts;
};

} // namespace parafetch::core::downloader
