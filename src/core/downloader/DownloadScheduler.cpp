/**
 * DownloadScheduler.cpp
 *
 * Worker loop, retry policy and per-chunk transfer.
 */

#include "DownloadScheduler.hpp"
#include "CapabilityProber.hpp"
#include "ResumeManager.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <fstream>
#include <future>

namespace parafetch::core::downloader {

// -- WorkQueue --

void WorkQueue::push(size_t index, Clock::time_point readyAt) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back({index, readyAt});
    }
    m_condition.notify_one();
}

std::optional<size_t> WorkQueue::acquire(const std::atomic<bool>& cancelFlag) {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_stopped || cancelFlag.load()) {
            return std::nullopt;
        }

        if (m_entries.empty()) {
            if (m_inFlight == 0) {
                return std::nullopt;
            }
            m_condition.wait_for(lock, kPollInterval);
            continue;
        }

        auto now = Clock::now();
        auto ready = std::find_if(m_entries.begin(), m_entries.end(),
                                  [now](const Entry& e) { return e.readyAt <= now; });

        if (ready != m_entries.end()) {
            size_t index = ready->index;
            m_entries.erase(ready);
            ++m_inFlight;
            return index;
        }

        auto earliest = std::min_element(m_entries.begin(), m_entries.end(),
            [](const Entry& a, const Entry& b) { return a.readyAt < b.readyAt; })->readyAt;
        m_condition.wait_until(lock, std::min(earliest, now + kPollInterval));
    }
}

void WorkQueue::complete() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_inFlight;
    }
    m_condition.notify_all();
}

void WorkQueue::retry(size_t index, Clock::time_point readyAt) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back({index, readyAt});
        --m_inFlight;
    }
    m_condition.notify_all();
}

void WorkQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
    }
    m_condition.notify_all();
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

size_t WorkQueue::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

// -- DownloadScheduler --

DownloadScheduler::DownloadScheduler(utils::HttpTransport& transport, const ResumeManager& parts,
                                     ProgressCounters& counters, std::atomic<bool>& cancelFlag)
    : m_transport(transport)
    , m_parts(parts)
    , m_counters(counters)
    , m_cancelled(cancelFlag) {
}

SchedulerResult DownloadScheduler::run(const DownloadJob& job, std::vector<Chunk>& chunks,
                                       const std::vector<size_t>& pending, const SchedulerOptions& options) {
    if (options.workers <= 0) {
        throw DownloadError(ErrorCode::InvalidConfiguration, "worker count must be positive");
    }
    if (options.maxRetries < 0) {
        throw DownloadError(ErrorCode::InvalidConfiguration, "retry limit must not be negative");
    }

    WorkQueue queue;
    for (size_t index : pending) {
        if (index >= chunks.size()) {
            throw std::out_of_range("pending chunk index " + std::to_string(index) + " out of range");
        }
        queue.push(index);
    }

    if (!pending.empty()) {
        size_t threads = std::min(static_cast<size_t>(options.workers), pending.size());
        LOG_DEBUG("Starting {} worker(s) for {} chunk(s)", threads, pending.size());

        std::vector<std::future<void>> workers;
        {
            ThreadPool pool(threads);
            workers.reserve(threads);
            for (size_t i = 0; i < threads; ++i) {
                workers.push_back(pool.submit([this, &job, &chunks, &queue, &options] {
                    workerLoop(job, chunks, queue, options);
                }));
            }
            pool.waitAll();
        }

        for (auto& worker : workers) {
            worker.get();
        }
    }

    SchedulerResult result;
    result.cancelled = m_cancelled.load();
    for (const auto& chunk : chunks) {
        if (chunk.state == ChunkState::Completed) {
            ++result.completed;
        } else if (chunk.state == ChunkState::Aborted) {
            result.aborted.push_back(chunk.index);
        }
    }
    return result;
}

void DownloadScheduler::workerLoop(const DownloadJob& job, std::vector<Chunk>& chunks,
                                   WorkQueue& queue, const SchedulerOptions& options) {
    while (auto index = queue.acquire(m_cancelled)) {
        Chunk& chunk = chunks[*index];
        uint64_t received = 0;

        try {
            chunk.advance(ChunkState::InProgress);
            ++chunk.attempts;

            LOG_DEBUG("Chunk {} [{}-{}] attempt {}", chunk.index, chunk.start, chunk.end, chunk.attempts);

            fetchChunk(job, chunk, received);

            chunk.advance(ChunkState::Completed);
            chunk.lastError.clear();
            m_counters.chunkCompleted();
            queue.complete();
            notifyChunk(chunk);

        } catch (const DownloadError& e) {
            m_counters.removeBytes(received);
            handleFailure(chunk, e, queue, options);

        } catch (...) {
            // Not an attempt failure: wake the other workers and surface it through the future
            queue.stop();
            throw;
        }
    }
}

void DownloadScheduler::handleFailure(Chunk& chunk, const DownloadError& error,
                                      WorkQueue& queue, const SchedulerOptions& options) {
    chunk.advance(ChunkState::Failed);
    chunk.lastError = error.what();

    if (error.code() == ErrorCode::Cancelled || m_cancelled.load()) {
        // Left for the next run; the part file is reconciled as Partial
        chunk.advance(ChunkState::Pending);
        queue.complete();
        LOG_DEBUG("Chunk {} interrupted", chunk.index);
        return;
    }

    if (chunk.attempts <= options.maxRetries) {
        auto delay = options.retryDelay * chunk.attempts;
        LOG_WARN("Chunk {} attempt {}/{} failed: {} (retrying in {} ms)",
                 chunk.index, chunk.attempts, options.maxRetries + 1, error.what(), delay.count());
        chunk.advance(ChunkState::Pending);
        queue.retry(chunk.index, WorkQueue::Clock::now() + delay);
        return;
    }

    chunk.advance(ChunkState::Aborted);
    m_counters.chunkFailed();
    LOG_ERROR("Chunk {} [{}-{}] aborted after {} attempt(s): {}",
              chunk.index, chunk.start, chunk.end, chunk.attempts, error.what());
    queue.complete();
    notifyChunk(chunk);
}

void DownloadScheduler::notifyChunk(const Chunk& chunk) {
    if (m_chunkCallback) {
        m_chunkCallback(chunk);
    }
}

void DownloadScheduler::fetchChunk(const DownloadJob& job, const Chunk& chunk, uint64_t& received) {
    fs::path partPath = m_parts.partPath(chunk);

    if (!utils::FileUtils::createDirectories(partPath.parent_path())) {
        throw DownloadError(ErrorCode::IoError, "cannot create directory " + partPath.parent_path().string());
    }

    std::ofstream file(partPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw DownloadError(ErrorCode::IoError, "cannot open part file " + partPath.string());
    }

    utils::HttpRequest request;
    request.url = job.url;
    request.headers["Accept"] = "*/*";
    if (job.rangesSupported) {
        request.headers["Range"] = "bytes=" + std::to_string(chunk.start) + "-" + std::to_string(chunk.end);
    }
    request.cancelFlag = &m_cancelled;

    const int expectedStatus = job.rangesSupported ? 206 : 200;
    const uint64_t expectedLength = chunk.length();

    bool statusRejected = false;
    bool rangeChecked = false;
    std::optional<std::string> rangeRejected;
    bool overflow = false;
    bool writeFailed = false;

    utils::HttpResponse response = m_transport.send(request,
        [&](const char* data, size_t size, const utils::HttpResponse& head) {
            if (head.statusCode != expectedStatus) {
                statusRejected = true;
                return false;
            }
            if (job.rangesSupported && !rangeChecked) {
                rangeChecked = true;
                auto contentRange = head.header("content-range");
                if (contentRange) {
                    auto span = CapabilityProber::parseContentRangeSpan(*contentRange);
                    if (!span || span->first != chunk.start || span->second != chunk.end) {
                        rangeRejected = *contentRange;
                        return false;
                    }
                }
            }
            if (received + size > expectedLength) {
                overflow = true;
                return false;
            }
            file.write(data, static_cast<std::streamsize>(size));
            if (!file) {
                writeFailed = true;
                return false;
            }
            received += size;
            m_counters.addBytes(size);
            return true;
        });

    file.close();

    if (m_cancelled.load()) {
        throw DownloadError(ErrorCode::Cancelled, "chunk " + std::to_string(chunk.index) + " cancelled");
    }

    if (writeFailed || file.fail()) {
        throw DownloadError(ErrorCode::IoError, "write to " + partPath.string() + " failed");
    }

    if (statusRejected || (!response.hasTransportError() && response.statusCode != expectedStatus)) {
        throw DownloadError(ErrorCode::UnexpectedStatus,
                            "expected HTTP " + std::to_string(expectedStatus) +
                            ", got " + std::to_string(response.statusCode));
    }

    if (rangeRejected) {
        throw DownloadError(ErrorCode::UnexpectedStatus,
                            "expected content-range bytes " + std::to_string(chunk.start) + "-" +
                            std::to_string(chunk.end) + ", got '" + *rangeRejected + "'");
    }

    if (overflow) {
        throw DownloadError(ErrorCode::ShortRead,
                            "server sent more than the " + std::to_string(expectedLength) + " requested bytes");
    }

    if (response.hasTransportError()) {
        throw DownloadError(response.timedOut ? ErrorCode::Timeout : ErrorCode::NetworkError, response.error);
    }

    if (received != expectedLength) {
        throw DownloadError(ErrorCode::ShortRead,
                            "received " + std::to_string(received) + " of " +
                            std::to_string(expectedLength) + " bytes");
    }
}

} // namespace parafetch::core::downloader
