#pragma once

/**
 * DownloadJob.hpp
 *
 * Job descriptor, chunk model and shared progress counters.
 */

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace parafetch::core::downloader {

/**
 * DownloadJob - immutable description of one download
 */
struct DownloadJob {
    // Source URL (final URL after redirects)
    std::string url;

    // Destination file path
    std::string output;

    // Total resource size, unknown until probed
    std::optional<uint64_t> totalSize;

    bool rangesSupported{false};

    uint64_t chunkSize{0};
    int workers{1};

    // Expected SHA-256 digest (optional, hex)
    std::optional<std::string> sha256;

    // Validators reported by the server
    std::string etag;
    std::string lastModified;
};

/**
 * Chunk state
 *
 * Pending -> InProgress -> Completed
 * InProgress -> Failed -> Pending (retry) | Aborted
 * Pending -> Completed (part file already complete on disk)
 */
enum class ChunkState {
    Pending,
    InProgress,
    Completed,
    Failed,
    Aborted
};

inline const char* chunkStateName(ChunkState state) {
    switch (state) {
        case ChunkState::Pending:    return "pending";
        case ChunkState::InProgress: return "in-progress";
        case ChunkState::Completed:  return "completed";
        case ChunkState::Failed:     return "failed";
        case ChunkState::Aborted:    return "aborted";
    }
    return "unknown";
}

inline bool isAllowedTransition(ChunkState from, ChunkState to) {
    switch (from) {
        case ChunkState::Pending:
            return to == ChunkState::InProgress || to == ChunkState::Completed;
        case ChunkState::InProgress:
            return to == ChunkState::Completed || to == ChunkState::Failed;
        case ChunkState::Failed:
            return to == ChunkState::Pending || to == ChunkState::Aborted;
        case ChunkState::Completed:
        case ChunkState::Aborted:
            return false;
    }
    return false;
}

/**
 * Chunk - one inclusive byte range of the resource
 */
struct Chunk {
    size_t index{0};
    uint64_t start{0};
    uint64_t end{0};

    ChunkState state{ChunkState::Pending};
    int attempts{0};
    std::string lastError;

    uint64_t length() const { return end - start + 1; }

    /**
     * Move to a new state
     * @throws std::logic_error on a transition the state machine does not allow
     */
    void advance(ChunkState next) {
        if (!isAllowedTransition(state, next)) {
            throw std::logic_error("chunk " + std::to_string(index) + ": illegal transition " +
                                   chunkStateName(state) + " -> " + chunkStateName(next));
        }
        state = next;
    }
};

/**
 * PartFile - on-disk bytes of one chunk
 */
struct PartFile {
    std::string path;
    uint64_t expectedLength{0};
    std::optional<uint64_t> actualLength;

    bool exists() const { return actualLength.has_value(); }
    bool isComplete() const { return actualLength && *actualLength == expectedLength; }
};

/**
 * ProgressCounters - shared between workers, atomics only
 */
class ProgressCounters {
public:
    void addBytes(uint64_t n) { m_bytes.fetch_add(n, std::memory_order_relaxed); }
    void removeBytes(uint64_t n) { m_bytes.fetch_sub(n, std::memory_order_relaxed); }
    void chunkCompleted() { m_completed.fetch_add(1, std::memory_order_relaxed); }
    void chunkFailed() { m_failed.fetch_add(1, std::memory_order_relaxed); }

    uint64_t bytes() const { return m_bytes.load(std::memory_order_relaxed); }
    size_t completed() const { return m_completed.load(std::memory_order_relaxed); }
    size_t failed() const { return m_failed.load(std::memory_order_relaxed); }

    void reset() {
        m_bytes = 0;
        m_completed = 0;
        m_failed = 0;
    }

private:
    std::atomic<uint64_t> m_bytes{0};
    std::atomic<size_t> m_completed{0};
    std::atomic<size_t> m_failed{0};
};

} // namespace parafetch::core::downloader
