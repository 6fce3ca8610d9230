#pragma once

/**
 * DownloadError.hpp
 *
 * Error codes and the exception type used across the download engine.
 */

#include <stdexcept>
#include <string>

namespace parafetch::core::downloader {

/**
 * Download error codes
 */
enum class ErrorCode {
    None,
    InvalidConfiguration,
    SizeUnknown,
    UnexpectedStatus,
    ShortRead,
    NetworkError,
    Timeout,
    IoError,
    DownloadFailed,
    AssemblyIncomplete,
    SizeMismatch,
    IntegrityMismatch,
    Cancelled
};

inline const char* errorCodeLabel(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "none";
        case ErrorCode::InvalidConfiguration: return "invalid configuration";
        case ErrorCode::SizeUnknown:          return "size unknown";
        case ErrorCode::UnexpectedStatus:     return "unexpected status";
        case ErrorCode::ShortRead:            return "short read";
        case ErrorCode::NetworkError:         return "network error";
        case ErrorCode::Timeout:              return "timeout";
        case ErrorCode::IoError:              return "i/o error";
        case ErrorCode::DownloadFailed:       return "download failed";
        case ErrorCode::AssemblyIncomplete:   return "assembly incomplete";
        case ErrorCode::SizeMismatch:         return "size mismatch";
        case ErrorCode::IntegrityMismatch:    return "integrity mismatch";
        case ErrorCode::Cancelled:            return "cancelled";
    }
    return "unknown";
}

/**
 * DownloadError - exception carrying an ErrorCode
 */
class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace parafetch::core::downloader
