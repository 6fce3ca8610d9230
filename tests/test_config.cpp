#include <catch2/catch.hpp>

#include "TestHelpers.hpp"
#include "core/Config.hpp"

using parafetch::core::Config;
using parafetch::test::TempDir;
using parafetch::test::writeFile;

TEST_CASE("defaults are available without a file") {
    auto& config = Config::instance();
    config.setDefaults();

    REQUIRE(config.get<int>("downloads.workers", 0) == 8);
    REQUIRE(config.get<int64_t>("downloads.chunkSize", -1) == 0);
    REQUIRE(config.get<int>("downloads.maxRetries", 0) == 3);
    REQUIRE(config.get<int>("downloads.retryDelayMs", 0) == 1000);
    REQUIRE(config.get<bool>("downloads.resume", false));
    REQUIRE_FALSE(config.get<bool>("downloads.keepParts", true));
    REQUIRE(config.get<std::string>("logging.level", "") == "info");
    REQUIRE(config.loadedPath().empty());
}

TEST_CASE("file values are merged over the defaults") {
    auto& config = Config::instance();
    config.setDefaults();

    TempDir dir;
    auto path = (dir / "config.json").string();
    writeFile(path, R"({"downloads": {"workers": 4, "keepParts": true}, "logging": {"level": "debug"}})");

    std::string error;
    REQUIRE(config.load(path, error));
    REQUIRE(error.empty());
    REQUIRE(config.loadedPath() == path);

    REQUIRE(config.get<int>("downloads.workers", 0) == 4);
    REQUIRE(config.get<bool>("downloads.keepParts", false));
    REQUIRE(config.get<int>("downloads.maxRetries", 0) == 3);
    REQUIRE(config.get<std::string>("logging.level", "") == "debug");

    config.setDefaults();
}

TEST_CASE("missing file is reported") {
    auto& config = Config::instance();
    config.setDefaults();

    TempDir dir;
    std::string error;
    REQUIRE_FALSE(config.load((dir / "absent.json").string(), error));
    REQUIRE_THAT(error, Catch::Contains("not found"));
}

TEST_CASE("malformed files are rejected and leave the defaults untouched") {
    auto& config = Config::instance();
    config.setDefaults();

    TempDir dir;
    std::string error;

    auto broken = (dir / "broken.json").string();
    writeFile(broken, "{\"downloads\": ");
    REQUIRE_FALSE(config.load(broken, error));
    REQUIRE_THAT(error, Catch::Contains("invalid config json"));

    auto array = (dir / "array.json").string();
    writeFile(array, "[1, 2, 3]");
    error.clear();
    REQUIRE_FALSE(config.load(array, error));
    REQUIRE_THAT(error, Catch::Contains("JSON object"));

    REQUIRE(config.get<int>("downloads.workers", 0) == 8);
}

TEST_CASE("values of the wrong type fall back to the caller's default") {
    auto& config = Config::instance();
    config.setDefaults();

    config.set("downloads.workers", std::string("many"));
    REQUIRE(config.get<int>("downloads.workers", 2) == 2);
    REQUIRE(config.get<int>("downloads.unknown", 5) == 5);
    REQUIRE_FALSE(config.has("downloads.unknown"));
    REQUIRE(config.has("downloads.workers"));

    config.setDefaults();
}
