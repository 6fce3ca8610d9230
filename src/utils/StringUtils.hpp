// parafetch - String Utilities
// String manipulation, parsing and formatting

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parafetch::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting and search
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(uint64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);

    // Validation
    static bool isNumeric(const std::string& str);
    static bool isHex(const std::string& str);
    static bool isUrl(const std::string& str);
    static std::string sanitizeFileName(const std::string& name);

    // Parsing (strict: the whole string must be consumed)
    static std::optional<uint64_t> parseUnsigned(const std::string& str);
    static std::optional<int64_t> parseLong(const std::string& str);

    /**
     * Parse a byte size such as "1048576", "512K", "4M", "2G" (binary multiples).
     * A leading '-' is accepted so that callers can reject non-positive sizes
     * with their own error.
     */
    static std::optional<int64_t> parseByteSize(const std::string& str);
};

} // namespace parafetch::utils
