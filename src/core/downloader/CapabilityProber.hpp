#pragma once

/**
 * CapabilityProber.hpp
 *
 * Discovers the size of a resource and whether the server honors
 * byte-range requests.
 */

#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace parafetch::core::downloader {

/**
 * What the server reported about a resource
 */
struct ResourceInfo {
    std::string finalUrl;
    int statusCode{0};
    std::optional<uint64_t> totalSize;
    bool rangesSupported{false};
    std::string etag;
    std::string lastModified;
};

class CapabilityProber {
public:
    explicit CapabilityProber(utils::HttpTransport& transport);

    /**
     * Probe a URL: HEAD first, then a one-byte ranged GET when HEAD says too little
     * @param url Resource URL
     * @param cancelFlag Optional stop request
     * @return Resource info; totalSize is empty when the server did not say
     * @throws DownloadError NetworkError, UnexpectedStatus or Cancelled
     */
    ResourceInfo probe(const std::string& url, const std::atomic<bool>* cancelFlag = nullptr);

    // Sizes past this are treated as unreported
    static constexpr uint64_t kMaxResourceSize = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    /**
     * Derive resource info from a final response head
     */
    static ResourceInfo interpret(int statusCode, const utils::HttpHeaders& headers,
                                  const std::string& finalUrl);

    static std::optional<uint64_t> parseContentLength(const std::string& value);

    /**
     * Total of "bytes a-b/TOTAL"; empty for "*" or malformed values
     */
    static std::optional<uint64_t> parseContentRangeTotal(const std::string& value);

    /**
     * First and last byte of "bytes a-b/TOTAL"; empty for "bytes *\/TOTAL" or malformed values
     */
    static std::optional<std::pair<uint64_t, uint64_t>> parseContentRangeSpan(const std::string& value);

    static bool advertisesRanges(const std::string& acceptRanges);

private:
    utils::HttpTransport& m_transport;
};

} // namespace parafetch::core::downloader
