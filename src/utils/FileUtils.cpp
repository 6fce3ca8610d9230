/**
 * FileUtils.cpp
 *
 * Non-throwing filesystem helpers.
 */

#include "FileUtils.hpp"

namespace parafetch::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::removeDirectoryIfEmpty(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return false;
    if (!fs::is_empty(path, ec) || ec) return false;
    return fs::remove(path, ec);
}

std::vector<fs::path> FileUtils::listFiles(const fs::path& path, const std::string& extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return files;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            if (extension.empty() || it->path().extension() == extension) {
                files.push_back(it->path());
            }
        }
    }
    return files;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return -1;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

} // namespace parafetch::utils
