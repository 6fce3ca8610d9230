#pragma once

/**
 * IntegrityVerifier.hpp
 *
 * SHA-256 check of the assembled output.
 */

#include <optional>
#include <string>

namespace parafetch::core::downloader {

class IntegrityVerifier {
public:
    static constexpr size_t kBlockSize = 1024 * 1024;

    /**
     * Verify a file against an expected digest
     * @param path File to hash
     * @param expected Hex digest, compared case-insensitively; nothing to do when empty
     * @return Computed digest (lower-case), or an empty string when skipped
     * @throws DownloadError IntegrityMismatch, or IoError when the file cannot be read
     */
    static std::string verify(const std::string& path, const std::optional<std::string>& expected);

    /**
     * @return true for exactly 64 hex characters
     */
    static bool isValidDigest(const std::string& hex);
};

} // namespace parafetch::core::downloader
