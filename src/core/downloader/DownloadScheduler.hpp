#pragma once

/**
 * DownloadScheduler.hpp
 *
 * Concurrent chunk download engine.
 * Workers drain one shared queue; failed chunks are requeued with a
 * linear backoff until their retry budget is spent.
 */

#include "DownloadJob.hpp"
#include "DownloadError.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace parafetch::core::downloader {

class ResumeManager;

struct SchedulerOptions {
    int workers{1};

    // Attempts allowed after the first one
    int maxRetries{3};

    // Base backoff; the n-th retry waits retryDelay * n
    std::chrono::milliseconds retryDelay{1000};
};

struct SchedulerResult {
    size_t completed{0};
    std::vector<size_t> aborted;
    bool cancelled{false};

    bool success() const { return !cancelled && aborted.empty(); }
};

/**
 * Called from worker threads when a chunk reaches Completed or Aborted
 */
using ChunkCallback = std::function<void(const Chunk& chunk)>;

/**
 * WorkQueue - chunk indices waiting for a worker
 *
 * Entries carry a ready time so retries can wait out their backoff
 * without holding a worker. acquire() returns nothing once the queue is
 * empty and no chunk is in flight, or after a stop request.
 */
class WorkQueue {
public:
    using Clock = std::chrono::steady_clock;

    void push(size_t index, Clock::time_point readyAt = Clock::now());

    std::optional<size_t> acquire(const std::atomic<bool>& cancelFlag);

    // In-flight chunk finished for good
    void complete();

    // In-flight chunk goes back into the queue
    void retry(size_t index, Clock::time_point readyAt);

    void stop();

    size_t size() const;
    size_t inFlight() const;

private:
    struct Entry {
        size_t index;
        Clock::time_point readyAt;
    };

    static constexpr std::chrono::milliseconds kPollInterval{100};

    std::deque<Entry> m_entries;
    size_t m_inFlight{0};
    bool m_stopped{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
};

/**
 * DownloadScheduler - runs one job's pending chunks to completion
 */
class DownloadScheduler {
public:
    /**
     * @param cancelFlag Raised by the owner to stop the run; also aborts transfers in flight
     */
    DownloadScheduler(utils::HttpTransport& transport, const ResumeManager& parts,
                      ProgressCounters& counters, std::atomic<bool>& cancelFlag);

    void setChunkCallback(ChunkCallback callback) { m_chunkCallback = std::move(callback); }

    /**
     * Download every pending chunk
     * @param job Job descriptor
     * @param chunks All planned chunks; pending ones must be in state Pending
     * @param pending Indices to download
     * @param options Concurrency and retry policy
     * @return Per-job result; chunks carry their final states
     */
    SchedulerResult run(const DownloadJob& job, std::vector<Chunk>& chunks,
                        const std::vector<size_t>& pending, const SchedulerOptions& options);

    /**
     * Stop dequeuing and abort transfers in flight. Safe from any thread.
     */
    void cancel() { m_cancelled.store(true); }

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * One attempt at one chunk: stream its range into the part file
     * @param received Bytes written so far, valid even when this throws
     * @throws DownloadError UnexpectedStatus, ShortRead, NetworkError, Timeout, IoError or Cancelled
     */
    void fetchChunk(const DownloadJob& job, const Chunk& chunk, uint64_t& received);

private:
    void workerLoop(const DownloadJob& job, std::vector<Chunk>& chunks,
                    WorkQueue& queue, const SchedulerOptions& options);

    void handleFailure(Chunk& chunk, const DownloadError& error,
                       WorkQueue& queue, const SchedulerOptions& options);

    void notifyChunk(const Chunk& chunk);

private:
    utils::HttpTransport& m_transport;
    const ResumeManager& m_parts;
    ProgressCounters& m_counters;

    std::atomic<bool>& m_cancelled;
    ChunkCallback m_chunkCallback;
};

} // namespace parafetch::core::downloader
