// parafetch - HTTP Client
// Streaming HTTP client using libcurl

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <curl/curl.h>

namespace parafetch::utils {

/**
 * @brief Header map. Response header names are stored lower-cased.
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief HTTP request description
 */
struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    HttpHeaders headers;

    // Raised by another thread to abort the transfer in flight
    const std::atomic<bool>* cancelFlag{nullptr};
};

/**
 * @brief HTTP response head plus transfer outcome
 */
struct HttpResponse {
    int statusCode{0};
    HttpHeaders headers;
    std::string effectiveUrl;
    std::string error;          // Transport error, empty when the transfer finished
    bool timedOut{false};
    bool aborted{false};        // Stopped by the body callback or the cancel flag
    uint64_t bodyBytes{0};

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isPartialContent() const { return statusCode == 206; }

    // A failure that was not requested by the caller
    bool hasTransportError() const { return !error.empty() && !aborted; }

    std::optional<std::string> header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Client-wide transfer options
 */
struct HttpOptions {
    int connectTimeoutSeconds{15};
    int inactivityTimeoutSeconds{60};  // Abort when no byte arrives for this long
    bool followRedirects{true};
    int maxRedirects{3};
    bool verifySSL{true};
    std::string userAgent{"parafetch/1.0"};

    // Custom CA bundle path (optional)
    std::string caBundle;
};

/**
 * @brief Receives body bytes in arrival order together with the response head.
 * Return false to abort the transfer.
 */
using BodyCallback = std::function<bool(const char* data, size_t size, const HttpResponse& head)>;

/**
 * @brief Send one request, receive status, headers and a body stream.
 *
 * Implementations must be safe to call from several threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request, const BodyCallback& onBody = nullptr) = 0;
};

/**
 * @brief libcurl implementation; one easy handle per request
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse send(const HttpRequest& request, const BodyCallback& onBody = nullptr) override;

    const HttpOptions& options() const { return m_options; }

    /**
     * Split one raw header line into a lower-cased name and a trimmed value.
     * @return false for status lines, blank lines and malformed input
     */
    static bool parseHeaderLine(const std::string& line, std::string& name, std::string& value);

private:
    HttpOptions m_options;

    void setupCurl(CURL* curl, const HttpRequest& request, curl_slist* headerList) const;

    static size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
};

/**
 * @brief RAII wrapper for CURL handle
 */
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return m_curl; }
    operator CURL*() const { return m_curl; }

private:
    CURL* m_curl{nullptr};
};

/**
 * @brief RAII wrapper for a curl header list
 */
class CurlHeaderList {
public:
    CurlHeaderList() = default;
    ~CurlHeaderList();

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    bool append(const std::string& line);
    curl_slist* get() const { return m_list; }

private:
    curl_slist* m_list{nullptr};
};

/**
 * @brief Global CURL initialization
 *
 * init() must complete before the first worker thread creates a handle.
 */
class CurlGlobalInit {
public:
    static bool init();
    static void cleanup();

private:
    static std::mutex s_mutex;
    static bool s_initialized;
};

} // namespace parafetch::utils
