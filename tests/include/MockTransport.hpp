#pragma once

/**
 * In-memory HttpTransport serving one resource.
 *
 * Honors Range headers, records every request and can inject failures
 * per range start.
 */

#include "utils/HttpClient.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace parafetch::test {

using utils::HttpRequest;
using utils::HttpResponse;
using utils::BodyCallback;

enum class FailureKind {
    NetworkError,   // Half the body, then a transport error
    Timeout,        // No body, inactivity timeout
    ShortBody,      // One byte missing, no error
    LongBody,       // One extra byte
    WrongStatus,    // 200 with the full body instead of 206
    WrongRange      // 206 with another slice of the same length, labelled as such
};

class MockTransport : public utils::HttpTransport {
public:
    explicit MockTransport(std::string body)
        : m_body(std::move(body)) {}

    // Server behaviour
    bool supportRanges{true};
    bool allowHead{true};
    bool reportLength{true};
    int forcedStatus{0};          // Non-zero: every response uses this status
    std::string etag;
    std::string lastModified;

    /**
     * Fail GETs for the range starting at start
     * @param times Number of failing attempts, -1 = always
     */
    void failRange(uint64_t start, int times, FailureKind kind) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures[start] = {times, kind};
    }

    /**
     * Hold the range starting at start until the range starting at before was served
     */
    void serveAfter(uint64_t start, uint64_t before) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_prerequisites[start] = before;
    }

    HttpResponse send(const HttpRequest& request, const BodyCallback& onBody = nullptr) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(request);
        }

        HttpResponse response;
        response.effectiveUrl = request.url;

        if (request.method == "HEAD") {
            return head(response);
        }

        uint64_t size = m_body.size();
        uint64_t start = 0;
        uint64_t end = size == 0 ? 0 : size - 1;
        bool ranged = false;

        auto range = request.headers.find("Range");
        if (supportRanges && range != request.headers.end()) {
            if (!parseRange(range->second, start, end) || start >= size) {
                response.statusCode = 416;
                return response;
            }
            end = std::min(end, size - 1);
            ranged = true;
        }

        std::optional<Failure> failure = takeFailure(start);
        waitForPrerequisite(start);

        response.statusCode = ranged ? 206 : 200;
        if (reportLength) {
            response.headers["content-length"] = std::to_string(ranged ? end - start + 1 : size);
            if (ranged) {
                response.headers["content-range"] =
                    "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(size);
            }
        } else if (ranged) {
            response.headers["content-range"] =
                "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/*";
        }
        if (supportRanges) response.headers["accept-ranges"] = "bytes";
        if (forcedStatus != 0) response.statusCode = forcedStatus;

        std::string payload = size == 0 ? std::string() : m_body.substr(start, end - start + 1);

        if (failure) {
            switch (failure->kind) {
                case FailureKind::NetworkError:
                    payload = payload.substr(0, payload.size() / 2);
                    break;
                case FailureKind::Timeout:
                    payload.clear();
                    break;
                case FailureKind::ShortBody:
                    if (!payload.empty()) payload.pop_back();
                    break;
                case FailureKind::LongBody:
                    payload.push_back('!');
                    break;
                case FailureKind::WrongRange: {
                    uint64_t length = end - start + 1;
                    uint64_t other = start == 0 ? size - length : 0;
                    payload = m_body.substr(other, length);
                    response.headers["content-range"] = "bytes " + std::to_string(other) + "-" +
                        std::to_string(other + length - 1) + "/" + std::to_string(size);
                    break;
                }
                case FailureKind::WrongStatus:
                    response.statusCode = 200;
                    response.headers.erase("content-range");
                    payload = m_body;
                    break;
            }
        }

        deliver(response, payload, request, onBody);

        if (failure && !response.aborted) {
            if (failure->kind == FailureKind::NetworkError) {
                response.error = "Connection reset by peer";
            } else if (failure->kind == FailureKind::Timeout) {
                response.error = "Operation timed out";
                response.timedOut = true;
            }
        }

        markServed(start);
        return response;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    // GET requests other than the one-byte probe
    std::vector<HttpRequest> downloads() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<HttpRequest> result;
        for (const auto& r : m_requests) {
            auto range = r.headers.find("Range");
            bool probe = range != r.headers.end() && range->second == "bytes=0-0";
            if (r.method == "GET" && !probe) result.push_back(r);
        }
        return result;
    }

    size_t countRange(const std::string& range) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_requests.begin(), m_requests.end(),
            [&range](const HttpRequest& r) {
                auto it = r.headers.find("Range");
                return it != r.headers.end() && it->second == range;
            }));
    }

    std::vector<uint64_t> servedOrder() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_servedOrder;
    }

    void clearLog() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.clear();
        m_servedOrder.clear();
        m_served.clear();
    }

private:
    struct Failure {
        int remaining;
        FailureKind kind;
    };

    HttpResponse& head(HttpResponse& response) {
        if (!allowHead) {
            response.statusCode = 405;
            return response;
        }
        response.statusCode = forcedStatus != 0 ? forcedStatus : 200;
        if (reportLength) response.headers["content-length"] = std::to_string(m_body.size());
        if (supportRanges) response.headers["accept-ranges"] = "bytes";
        if (!etag.empty()) response.headers["etag"] = etag;
        if (!lastModified.empty()) response.headers["last-modified"] = lastModified;
        return response;
    }

    static bool parseRange(const std::string& value, uint64_t& start, uint64_t& end) {
        const std::string prefix = "bytes=";
        if (value.compare(0, prefix.size(), prefix) != 0) return false;
        auto dash = value.find('-', prefix.size());
        if (dash == std::string::npos) return false;
        start = std::stoull(value.substr(prefix.size(), dash - prefix.size()));
        end = std::stoull(value.substr(dash + 1));
        return start <= end;
    }

    std::optional<Failure> takeFailure(uint64_t start) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_failures.find(start);
        if (it == m_failures.end() || it->second.remaining == 0) return std::nullopt;
        if (it->second.remaining > 0) --it->second.remaining;
        return it->second;
    }

    void waitForPrerequisite(uint64_t start) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_prerequisites.find(start);
        if (it == m_prerequisites.end()) return;
        uint64_t before = it->second;
        m_servedCondition.wait_for(lock, std::chrono::seconds(5),
                                   [this, before] { return m_served.count(before) > 0; });
    }

    void markServed(uint64_t start) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_served.insert(start);
            m_servedOrder.push_back(start);
        }
        m_servedCondition.notify_all();
    }

    static void deliver(HttpResponse& response, const std::string& payload,
                        const HttpRequest& request, const BodyCallback& onBody) {
        const size_t piece = 3;
        for (size_t offset = 0; offset < payload.size(); offset += piece) {
            if (request.cancelFlag && request.cancelFlag->load()) {
                response.aborted = true;
                response.error = "Callback aborted";
                return;
            }
            size_t n = std::min(piece, payload.size() - offset);
            if (onBody && !onBody(payload.data() + offset, n, response)) {
                response.aborted = true;
                response.error = "Failed writing received data";
                return;
            }
            response.bodyBytes += n;
        }
    }

private:
    std::string m_body;

    mutable std::mutex m_mutex;
    std::condition_variable m_servedCondition;
    std::vector<HttpRequest> m_requests;
    std::map<uint64_t, Failure> m_failures;
    std::map<uint64_t, uint64_t> m_prerequisites;
    std::set<uint64_t> m_served;
    std::vector<uint64_t> m_servedOrder;
};

} // namespace parafetch::test
