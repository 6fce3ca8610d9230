#pragma once

/**
 * CommandLine.hpp
 *
 * Command-line options. Values given here override the configuration file.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parafetch::core {

struct CommandLine {
    std::string url;
    std::string output;

    std::optional<int> workers;
    std::optional<int64_t> chunkSize;
    std::optional<std::string> sha256;
    std::optional<int> maxRetries;
    std::optional<int> retryDelayMs;
    std::optional<int> timeoutSeconds;

    bool noResume{false};
    bool keepParts{false};
    bool debug{false};
    bool showHelp{false};
    bool showVersion{false};

    std::string configPath;
    std::string logFile;

    /**
     * Parse arguments (without the program name)
     * @param args Arguments
     * @param out Receives the parsed options
     * @param error Receives the reason on failure
     * @return true if the arguments are well-formed
     */
    static bool parse(const std::vector<std::string>& args, CommandLine& out, std::string& error);

    static std::string usage(const std::string& program);
};

} // namespace parafetch::core
