/**
 * CapabilityProber.cpp
 */

#include "CapabilityProber.hpp"
#include "DownloadError.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace parafetch::core::downloader {

using utils::StringUtils;

CapabilityProber::CapabilityProber(utils::HttpTransport& transport)
    : m_transport(transport) {
}

ResourceInfo CapabilityProber::probe(const std::string& url, const std::atomic<bool>* cancelFlag) {
    utils::HttpRequest head;
    head.method = "HEAD";
    head.url = url;
    head.headers["Accept"] = "*/*";
    head.cancelFlag = cancelFlag;

    utils::HttpResponse headResponse = m_transport.send(head);

    if (cancelFlag && cancelFlag->load()) {
        throw DownloadError(ErrorCode::Cancelled, "probe cancelled");
    }

    if (!headResponse.hasTransportError() && headResponse.isSuccess() &&
        (headResponse.header("content-length") || headResponse.header("accept-ranges"))) {
        LOG_DEBUG("HEAD {} -> {}", url, headResponse.statusCode);
        return interpret(headResponse.statusCode, headResponse.headers, headResponse.effectiveUrl);
    }

    if (headResponse.hasTransportError()) {
        LOG_DEBUG("HEAD {} failed ({}), trying ranged GET", url, headResponse.error);
    } else {
        LOG_DEBUG("HEAD {} -> {} without size information, trying ranged GET", url, headResponse.statusCode);
    }

    std::string getUrl = headResponse.effectiveUrl.empty() ? url : headResponse.effectiveUrl;

    utils::HttpRequest get;
    get.url = getUrl;
    get.headers["Accept"] = "*/*";
    get.headers["Range"] = "bytes=0-0";
    get.cancelFlag = cancelFlag;

    // Only the head matters; stop at the first body byte
    utils::HttpResponse getResponse = m_transport.send(get,
        [](const char*, size_t, const utils::HttpResponse&) { return false; });

    if (cancelFlag && cancelFlag->load()) {
        throw DownloadError(ErrorCode::Cancelled, "probe cancelled");
    }

    if (getResponse.hasTransportError()) {
        throw DownloadError(getResponse.timedOut ? ErrorCode::Timeout : ErrorCode::NetworkError,
                            "probe of " + url + " failed: " + getResponse.error);
    }

    if (!getResponse.isSuccess()) {
        throw DownloadError(ErrorCode::UnexpectedStatus,
                            "probe of " + url + " returned HTTP " + std::to_string(getResponse.statusCode));
    }

    LOG_DEBUG("GET {} (bytes=0-0) -> {}", getUrl, getResponse.statusCode);

    utils::HttpHeaders merged = getResponse.headers;

    // Content-Length of a 206 is the length of the slice, not of the resource
    if (getResponse.isPartialContent()) {
        merged.erase("content-length");
    }

    if (!headResponse.hasTransportError() && headResponse.isSuccess()) {
        for (const auto& [name, value] : headResponse.headers) {
            merged.emplace(name, value);
        }
    }

    std::string finalUrl = getResponse.effectiveUrl.empty() ? getUrl : getResponse.effectiveUrl;
    return interpret(getResponse.statusCode, merged, finalUrl);
}

ResourceInfo CapabilityProber::interpret(int statusCode, const utils::HttpHeaders& headers,
                                         const std::string& finalUrl) {
    ResourceInfo info;
    info.finalUrl = finalUrl;
    info.statusCode = statusCode;

    auto find = [&headers](const char* name) -> std::string {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    };

    std::string contentRange = find("content-range");
    std::string contentLength = find("content-length");
    std::string acceptRanges = find("accept-ranges");

    if (!contentRange.empty()) {
        info.totalSize = parseContentRangeTotal(contentRange);
    }
    if (!info.totalSize && !contentLength.empty()) {
        info.totalSize = parseContentLength(contentLength);
    }
    if (info.totalSize && *info.totalSize > kMaxResourceSize) {
        LOG_WARN("Ignoring implausible resource size {} reported for {}", *info.totalSize, finalUrl);
        info.totalSize.reset();
    }

    info.rangesSupported = statusCode == 206 || !contentRange.empty() || advertisesRanges(acceptRanges);

    info.etag = find("etag");
    info.lastModified = find("last-modified");
    return info;
}

std::optional<uint64_t> CapabilityProber::parseContentLength(const std::string& value) {
    return StringUtils::parseUnsigned(StringUtils::trim(value));
}

std::optional<uint64_t> CapabilityProber::parseContentRangeTotal(const std::string& value) {
    auto slash = value.rfind('/');
    if (slash == std::string::npos) return std::nullopt;

    std::string unit = StringUtils::toLower(StringUtils::trim(value.substr(0, value.find(' '))));
    if (unit != "bytes") return std::nullopt;

    return StringUtils::parseUnsigned(StringUtils::trim(value.substr(slash + 1)));
}

std::optional<std::pair<uint64_t, uint64_t>> CapabilityProber::parseContentRangeSpan(const std::string& value) {
    std::string text = StringUtils::trim(value);
    auto space = text.find(' ');
    auto slash = text.rfind('/');
    if (space == std::string::npos || slash == std::string::npos || slash < space) return std::nullopt;
    if (StringUtils::toLower(text.substr(0, space)) != "bytes") return std::nullopt;

    std::string span = StringUtils::trim(text.substr(space + 1, slash - space - 1));
    auto dash = span.find('-');
    if (dash == std::string::npos) return std::nullopt;

    auto first = StringUtils::parseUnsigned(span.substr(0, dash));
    auto last = StringUtils::parseUnsigned(span.substr(dash + 1));
    if (!first || !last || *first > *last) return std::nullopt;
    return std::make_pair(*first, *last);
}

bool CapabilityProber::advertisesRanges(const std::string& acceptRanges) {
    for (const auto& token : StringUtils::split(acceptRanges, ',')) {
        if (StringUtils::equalsIgnoreCase(StringUtils::trim(token), "bytes")) {
            return true;
        }
    }
    return false;
}

} // namespace parafetch::core::downloader
