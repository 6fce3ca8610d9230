#include <catch2/catch.hpp>

#include "core/Application.hpp"
#include "core/CommandLine.hpp"
#include "core/Config.hpp"
#include "core/downloader/DownloadManager.hpp"

using parafetch::core::Application;
using parafetch::core::CommandLine;
using parafetch::core::Config;
using parafetch::core::downloader::ErrorCode;

namespace {

CommandLine parseOk(const std::vector<std::string>& args) {
    CommandLine cmd;
    std::string error;
    bool parsed = CommandLine::parse(args, cmd, error);
    INFO("error: " << error);
    REQUIRE(parsed);
    return cmd;
}

std::string parseError(const std::vector<std::string>& args) {
    CommandLine cmd;
    std::string error;
    REQUIRE_FALSE(CommandLine::parse(args, cmd, error));
    return error;
}

} // namespace

TEST_CASE("url and options are parsed") {
    CommandLine cmd = parseOk({"-w", "4", "--chunk-size", "2M", "-o", "out.iso",
                               "--sha256", " ABCDEF ", "--max-retries=5", "--retry-delay-ms", "250",
                               "-t", "30", "--no-resume", "--keep-parts", "-d",
                               "https://example.com/file.iso"});

    REQUIRE(cmd.url == "https://example.com/file.iso");
    REQUIRE(cmd.output == "out.iso");
    REQUIRE(cmd.workers == 4);
    REQUIRE(cmd.chunkSize == 2 * 1024 * 1024);
    REQUIRE(cmd.sha256 == std::string("ABCDEF"));
    REQUIRE(cmd.maxRetries == 5);
    REQUIRE(cmd.retryDelayMs == 250);
    REQUIRE(cmd.timeoutSeconds == 30);
    REQUIRE(cmd.noResume);
    REQUIRE(cmd.keepParts);
    REQUIRE(cmd.debug);
}

TEST_CASE("chunk size in MiB") {
    CommandLine cmd = parseOk({"--chunk-size-mb", "8", "http://h/x"});
    REQUIRE(cmd.chunkSize == 8 * 1024 * 1024);

    REQUIRE_THAT(parseError({"--chunk-size-mb", "99999999999999999", "http://h/x"}),
                 Catch::Contains("invalid chunk size"));
}

TEST_CASE("non-positive values parse and are left to validation") {
    CommandLine cmd = parseOk({"--workers", "0", "--chunk-size", "-1", "http://h/x"});
    REQUIRE(cmd.workers == 0);
    REQUIRE(cmd.chunkSize == -1);
}

TEST_CASE("help and version need no URL") {
    REQUIRE(parseOk({"--help"}).showHelp);
    REQUIRE(parseOk({"-v"}).showVersion);
}

TEST_CASE("malformed command lines are rejected") {
    REQUIRE(parseError({}) == "missing URL");
    REQUIRE(parseError({"--bogus", "http://h/x"}) == "unknown option: --bogus");
    REQUIRE(parseError({"http://h/a", "http://h/b"}) == "unexpected argument: http://h/b");
    REQUIRE(parseError({"http://h/x", "--workers"}) == "missing value for --workers");
    REQUIRE(parseError({"-w", "four", "http://h/x"}) == "invalid value for -w: 'four'");
    REQUIRE(parseError({"-c", "lots", "http://h/x"}) == "invalid chunk size: 'lots'");
    REQUIRE_THAT(parseError({"--keep-parts=yes", "http://h/x"}), Catch::Contains("takes no value"));
}

TEST_CASE("download options come from the configuration unless overridden") {
    auto& config = Config::instance();
    config.setDefaults();

    SECTION("defaults") {
        auto options = Application::buildOptions(parseOk({"http://h/x"}));
        REQUIRE(options.url == "http://h/x");
        REQUIRE(options.output.empty());
        REQUIRE(options.workers == 8);
        REQUIRE_FALSE(options.chunkSize);
        REQUIRE(options.maxRetries == 3);
        REQUIRE(options.retryDelay == std::chrono::milliseconds(1000));
        REQUIRE(options.resume);
        REQUIRE_FALSE(options.keepParts);
        REQUIRE_FALSE(options.sha256);
    }

    SECTION("configured values") {
        config.set("downloads.workers", 2);
        config.set("downloads.chunkSize", 4096);
        config.set("downloads.keepParts", true);
        config.set("downloads.resume", false);

        auto options = Application::buildOptions(parseOk({"http://h/x"}));
        REQUIRE(options.workers == 2);
        REQUIRE(options.chunkSize == int64_t{4096});
        REQUIRE(options.keepParts);
        REQUIRE_FALSE(options.resume);
    }

    SECTION("command line wins") {
        config.set("downloads.workers", 2);
        config.set("downloads.chunkSize", 4096);

        auto options = Application::buildOptions(parseOk({"-w", "6", "-c", "100", "-r", "0", "http://h/x"}));
        REQUIRE(options.workers == 6);
        REQUIRE(options.chunkSize == int64_t{100});
        REQUIRE(options.maxRetries == 0);
    }

    config.setDefaults();
}

TEST_CASE("usage spells out how retries count") {
    std::string text = CommandLine::usage("parafetch");
    REQUIRE_THAT(text, Catch::Contains("--max-retries"));
    REQUIRE_THAT(text, Catch::Contains("up to n + 1 attempts"));
}

TEST_CASE("error codes map to exit codes") {
    REQUIRE(Application::exitCodeFor(ErrorCode::None) == 0);
    REQUIRE(Application::exitCodeFor(ErrorCode::InvalidConfiguration) == 64);
    REQUIRE(Application::exitCodeFor(ErrorCode::SizeMismatch) == 2);
    REQUIRE(Application::exitCodeFor(ErrorCode::IntegrityMismatch) == 2);
    REQUIRE(Application::exitCodeFor(ErrorCode::Cancelled) == 130);
    REQUIRE(Application::exitCodeFor(ErrorCode::DownloadFailed) == 1);
    REQUIRE(Application::exitCodeFor(ErrorCode::SizeUnknown) == 1);
    REQUIRE(Application::exitCodeFor(ErrorCode::NetworkError) == 1);
}
