/**
 * IntegrityVerifier.cpp
 */

#include "IntegrityVerifier.hpp"
#include "DownloadError.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace parafetch::core::downloader {

using utils::StringUtils;

std::string IntegrityVerifier::verify(const std::string& path, const std::optional<std::string>& expected) {
    if (!expected || expected->empty()) {
        return "";
    }

    std::string actual = utils::HashUtils::sha256File(path, kBlockSize);
    if (actual.empty()) {
        throw DownloadError(ErrorCode::IoError, "cannot read " + path + " for hashing");
    }

    std::string wanted = StringUtils::trim(*expected);
    if (!StringUtils::equalsIgnoreCase(actual, wanted)) {
        throw DownloadError(ErrorCode::IntegrityMismatch,
                            "SHA-256 mismatch: expected " + StringUtils::toLower(wanted) + ", got " + actual);
    }

    LOG_DEBUG("SHA-256 verified: {}", actual);
    return actual;
}

bool IntegrityVerifier::isValidDigest(const std::string& hex) {
    return hex.size() == 64 && StringUtils::isHex(hex);
}

} // namespace parafetch::core::downloader
