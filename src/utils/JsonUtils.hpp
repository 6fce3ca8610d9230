// parafetch - JSON Utilities
// JSON file persistence and safe accessors

#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace parafetch::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parseFile(const std::filesystem::path& path);

    /**
     * Write through a sibling temporary file and rename it over the target,
     * so readers never observe a half-written document.
     */
    static bool writeFileAtomic(const std::filesystem::path& path, const json& j, int indent = 2);

    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static bool getBool(const json& j, const std::string& key, bool defaultValue = false);
};

} // namespace parafetch::utils
