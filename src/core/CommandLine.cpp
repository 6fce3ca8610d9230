/**
 * CommandLine.cpp
 */

#include "CommandLine.hpp"
#include "../utils/StringUtils.hpp"

#include <limits>
#include <sstream>

namespace parafetch::core {

using utils::StringUtils;

namespace {

constexpr int64_t kMiB = 1024 * 1024;

bool parseInt(const std::string& option, const std::string& text, std::optional<int>& out, std::string& error) {
    auto value = StringUtils::parseLong(text);
    if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        error = "invalid value for " + option + ": '" + text + "'";
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}

} // namespace

bool CommandLine::parse(const std::vector<std::string>& args, CommandLine& out, std::string& error) {
    out = CommandLine{};

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inlineValue;

        // --option=value
        if (StringUtils::startsWith(arg, "--")) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        if (inlineValue && (arg == "--help" || arg == "--version" || arg == "--debug" ||
                            arg == "--no-resume" || arg == "--keep-parts")) {
            error = "option " + arg + " takes no value";
            return false;
        }

        auto value = [&](std::string& target) -> bool {
            if (inlineValue) {
                target = *inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) {
                error = "missing value for " + arg;
                return false;
            }
            target = args[++i];
            return true;
        };

        std::string text;

        if (arg == "-h" || arg == "--help") {
            out.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            out.showVersion = true;
        } else if (arg == "-d" || arg == "--debug") {
            out.debug = true;
        } else if (arg == "--no-resume") {
            out.noResume = true;
        } else if (arg == "--keep-parts") {
            out.keepParts = true;
        } else if (arg == "-o" || arg == "--output") {
            if (!value(out.output)) return false;
        } else if (arg == "--config") {
            if (!value(out.configPath)) return false;
        } else if (arg == "--log-file") {
            if (!value(out.logFile)) return false;
        } else if (arg == "--sha256") {
            if (!value(text)) return false;
            out.sha256 = StringUtils::trim(text);
        } else if (arg == "-w" || arg == "--workers") {
            if (!value(text) || !parseInt(arg, text, out.workers, error)) return false;
        } else if (arg == "-r" || arg == "--max-retries") {
            if (!value(text) || !parseInt(arg, text, out.maxRetries, error)) return false;
        } else if (arg == "--retry-delay-ms") {
            if (!value(text) || !parseInt(arg, text, out.retryDelayMs, error)) return false;
        } else if (arg == "-t" || arg == "--timeout") {
            if (!value(text) || !parseInt(arg, text, out.timeoutSeconds, error)) return false;
        } else if (arg == "-c" || arg == "--chunk-size") {
            if (!value(text)) return false;
            auto size = StringUtils::parseByteSize(text);
            if (!size) {
                error = "invalid chunk size: '" + text + "'";
                return false;
            }
            out.chunkSize = *size;
        } else if (arg == "--chunk-size-mb") {
            if (!value(text)) return false;
            auto mb = StringUtils::parseLong(text);
            if (!mb || *mb > std::numeric_limits<int64_t>::max() / kMiB ||
                *mb < std::numeric_limits<int64_t>::min() / kMiB) {
                error = "invalid chunk size: '" + text + "'";
                return false;
            }
            out.chunkSize = *mb * kMiB;
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        } else if (out.url.empty()) {
            out.url = arg;
        } else {
            error = "unexpected argument: " + arg;
            return false;
        }

    }

    if (out.url.empty() && !out.showHelp && !out.showVersion) {
        error = "missing URL";
        return false;
    }

    return true;
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "parafetch - segmented HTTP downloader\n"
        << "\nUsage: " << program << " [options] <url>\n"
        << "\nOptions:\n"
        << "  -o, --output <path>        Output file (default: last URL path segment)\n"
        << "  -w, --workers <n>          Concurrent connections (default 8)\n"
        << "  -c, --chunk-size <size>    Chunk size in bytes, K/M/G suffixes allowed\n"
        << "      --chunk-size-mb <n>    Chunk size in MiB\n"
        << "      --sha256 <hex>         Expected SHA-256 of the result\n"
        << "  -r, --max-retries <n>      Retries per chunk after the first attempt (default 3);\n"
        << "                             each chunk gets up to n + 1 attempts\n"
        << "      --retry-delay-ms <n>   Base retry backoff (default 1000)\n"
        << "  -t, --timeout <seconds>    Inactivity timeout per request (default 60)\n"
        << "      --no-resume            Discard existing part files\n"
        << "      --keep-parts           Keep part files after success\n"
        << "      --config <path>        JSON configuration file\n"
        << "      --log-file <path>      Also log to a rotating file\n"
        << "  -d, --debug                Enable debug logging\n"
        << "  -h, --help                 Show this help message\n"
        << "  -v, --version              Show version information\n";
    return oss.str();
}

} // namespace parafetch::core
