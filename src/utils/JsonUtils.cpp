/**
 * JsonUtils.cpp
 *
 * JSON parsing and persistence helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>

namespace parafetch::utils {

// -- Parsing --

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Serialization --

bool JsonUtils::writeFileAtomic(const std::filesystem::path& path, const json& j, int indent) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) return false;
        file << j.dump(indent);
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int64_t>();
    return defaultValue;
}

bool JsonUtils::getBool(const json& j, const std::string& key, bool defaultValue) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return defaultValue;
}

} // namespace parafetch::utils
