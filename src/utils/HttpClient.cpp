/**
 * HttpClient.cpp
 *
 * HTTP client implementation on the libcurl easy interface.
 * Bodies are streamed to the caller; nothing is buffered here.
 */

#include "HttpClient.hpp"
#include "StringUtils.hpp"

namespace parafetch::utils {

namespace {

// Per-transfer state shared with the curl callbacks
struct TransferState {
    HttpResponse* response{nullptr};
    CURL* curl{nullptr};
    const BodyCallback* onBody{nullptr};
    const std::atomic<bool>* cancelFlag{nullptr};
    bool stoppedByCallback{false};
};

} // namespace

// -- CurlGlobalInit --

std::mutex CurlGlobalInit::s_mutex;
bool CurlGlobalInit::s_initialized = false;

bool CurlGlobalInit::init() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized) {
        s_initialized = curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK;
    }
    return s_initialized;
}

void CurlGlobalInit::cleanup() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- CurlHandle --

CurlHandle::CurlHandle() : m_curl(curl_easy_init()) {}
CurlHandle::~CurlHandle() { if (m_curl) curl_easy_cleanup(m_curl); }

// -- CurlHeaderList --

CurlHeaderList::~CurlHeaderList() { if (m_list) curl_slist_free_all(m_list); }

bool CurlHeaderList::append(const std::string& line) {
    curl_slist* next = curl_slist_append(m_list, line.c_str());
    if (!next) return false;
    m_list = next;
    return true;
}

// -- HttpClient --

HttpClient::HttpClient(HttpOptions options) : m_options(std::move(options)) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;

bool HttpClient::parseHeaderLine(const std::string& line, std::string& name, std::string& value) {
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (StringUtils::startsWith(line, "HTTP/")) return false;

    name = StringUtils::toLower(StringUtils::trim(line.substr(0, colon)));
    value = StringUtils::trim(line.substr(colon + 1));
    return !name.empty();
}

HttpResponse HttpClient::send(const HttpRequest& request, const BodyCallback& onBody) {
    HttpResponse result;

    CurlHandle curl;
    if (!curl.get()) {
        result.error = "failed to create curl handle";
        return result;
    }

    CurlHeaderList headerList;
    for (const auto& [key, value] : request.headers) {
        if (!headerList.append(key + ": " + value)) {
            result.error = "failed to build request headers";
            return result;
        }
    }

    TransferState state;
    state.response = &result;
    state.curl = curl.get();
    state.onBody = onBody ? &onBody : nullptr;
    state.cancelFlag = request.cancelFlag;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    setupCurl(curl, request, headerList.get());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpClient::writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &HttpClient::headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &HttpClient::progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    CURLcode rc = curl_easy_perform(curl);

    long status = 0;
    if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status) == CURLE_OK) {
        result.statusCode = static_cast<int>(status);
    }

    char* effectiveUrl = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl) {
        result.effectiveUrl = effectiveUrl;
    } else {
        result.effectiveUrl = request.url;
    }

    if (rc != CURLE_OK) {
        if (state.stoppedByCallback || rc == CURLE_ABORTED_BY_CALLBACK) {
            result.aborted = true;
        } else if (rc == CURLE_OPERATION_TIMEDOUT) {
            result.timedOut = true;
        }
        result.error = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(rc);
    }

    return result;
}

void HttpClient::setupCurl(CURL* curl, const HttpRequest& request, curl_slist* headerList) const {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, m_options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(m_options.maxRedirects));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_options.connectTimeoutSeconds));

    // Inactivity timeout: fewer than 1 byte/s for the whole window aborts the transfer
    if (m_options.inactivityTimeoutSeconds > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(m_options.inactivityTimeoutSeconds));
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_options.verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_options.verifySSL ? 2L : 0L);
    if (!m_options.caBundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, m_options.caBundle.c_str());
    }
}

size_t HttpClient::writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t total = size * nmemb;

    if (state->response->statusCode == 0) {
        long status = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
        state->response->statusCode = static_cast<int>(status);
    }

    if (state->onBody && !(*state->onBody)(contents, total, *state->response)) {
        state->stoppedByCallback = true;
        return 0;
    }

    state->response->bodyBytes += total;
    return total;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    if (StringUtils::startsWith(line, "HTTP/")) {
        // New response (redirect hop or interim 1xx): keep only the final head
        state->response->headers.clear();
        state->response->statusCode = 0;
        auto parts = StringUtils::split(StringUtils::trim(line), ' ');
        if (parts.size() >= 2) {
            auto code = StringUtils::parseUnsigned(parts[1]);
            if (code) state->response->statusCode = static_cast<int>(*code);
        }
        return total;
    }

    std::string name;
    std::string value;
    if (parseHeaderLine(line, name, value)) {
        state->response->headers[name] = value;
    }
    return total;
}

int HttpClient::progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                 curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->cancelFlag && state->cancelFlag->load(std::memory_order_relaxed)) {
        return 1;
    }
    return 0;
}

} // namespace parafetch::utils
