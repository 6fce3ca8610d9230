// parafetch - File Utilities
// Thin, non-throwing wrappers over std::filesystem

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

namespace parafetch::utils {

/**
 * @brief File and directory utilities
 *
 * Every function reports failure through its return value and never throws.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool removeDirectoryIfEmpty(const fs::path& path);
    static std::vector<fs::path> listFiles(const fs::path& path, const std::string& extension = "");

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);

    /**
     * Size of a regular file
     * @return Size in bytes, or -1 if the file does not exist or cannot be queried
     */
    static int64_t getFileSize(const fs::path& path);
};

} // namespace parafetch::utils
