/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>

namespace parafetch::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && toLower(a) == toLower(b);
}

// -- Splitting and search --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (value * 100.0) << "%";
    return oss.str();
}

// -- Validation --

bool StringUtils::isNumeric(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool StringUtils::isHex(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(),
                                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool StringUtils::isUrl(const std::string& str) {
    auto lower = toLower(str);
    return startsWith(lower, "http://") || startsWith(lower, "https://");
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') result += c;
        else result += '_';
    }
    return result;
}

// -- Parsing --

std::optional<uint64_t> StringUtils::parseUnsigned(const std::string& str) {
    auto digits = trim(str);
    if (!isNumeric(digits)) return std::nullopt;

    uint64_t value = 0;
    for (char c : digits) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::optional<int64_t> StringUtils::parseLong(const std::string& str) {
    auto text = trim(str);
    bool negative = !text.empty() && text[0] == '-';
    auto magnitude = parseUnsigned(negative ? text.substr(1) : text);
    if (!magnitude || *magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    auto value = static_cast<int64_t>(*magnitude);
    return negative ? -value : value;
}

std::optional<int64_t> StringUtils::parseByteSize(const std::string& str) {
    auto text = trim(str);
    if (text.empty()) return std::nullopt;

    int64_t multiplier = 1;
    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    if (suffix == 'K' || suffix == 'M' || suffix == 'G') {
        multiplier = suffix == 'K' ? 1024LL : suffix == 'M' ? 1024LL * 1024 : 1024LL * 1024 * 1024;
        text.pop_back();
    }

    auto value = parseLong(text);
    if (!value) return std::nullopt;
    if (*value > std::numeric_limits<int64_t>::max() / multiplier ||
        *value < std::numeric_limits<int64_t>::min() / multiplier) {
        return std::nullopt;
    }
    return *value * multiplier;
}

} // namespace parafetch::utils
