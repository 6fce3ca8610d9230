#include <catch2/catch.hpp>

#include "utils/StringUtils.hpp"

using parafetch::utils::StringUtils;

TEST_CASE("byte sizes with binary suffixes") {
    REQUIRE(StringUtils::parseByteSize("4096") == 4096);
    REQUIRE(StringUtils::parseByteSize("4K") == 4096);
    REQUIRE(StringUtils::parseByteSize("4k") == 4096);
    REQUIRE(StringUtils::parseByteSize("8M") == 8LL * 1024 * 1024);
    REQUIRE(StringUtils::parseByteSize("2G") == 2LL * 1024 * 1024 * 1024);
    REQUIRE(StringUtils::parseByteSize("-1") == -1);
    REQUIRE(StringUtils::parseByteSize("0") == 0);

    REQUIRE_FALSE(StringUtils::parseByteSize(""));
    REQUIRE_FALSE(StringUtils::parseByteSize("M"));
    REQUIRE_FALSE(StringUtils::parseByteSize("4KB"));
    REQUIRE_FALSE(StringUtils::parseByteSize("1.5M"));
    REQUIRE_FALSE(StringUtils::parseByteSize("99999999999999999G"));
}

TEST_CASE("unsigned parsing is strict") {
    REQUIRE(StringUtils::parseUnsigned("0") == 0u);
    REQUIRE(StringUtils::parseUnsigned("18446744073709551615") == 18446744073709551615ULL);
    REQUIRE_FALSE(StringUtils::parseUnsigned("18446744073709551616"));
    REQUIRE_FALSE(StringUtils::parseUnsigned("+5"));
    REQUIRE_FALSE(StringUtils::parseUnsigned("5 5"));

    REQUIRE(StringUtils::parseLong("-42") == -42);
    REQUIRE_FALSE(StringUtils::parseLong("--42"));
}

TEST_CASE("formatting") {
    REQUIRE(StringUtils::formatBytes(512) == "512 B");
    REQUIRE(StringUtils::formatBytes(1536) == "1.5 KB");
    REQUIRE(StringUtils::formatBytes(10ULL * 1024 * 1024) == "10.0 MB");
    REQUIRE(StringUtils::formatPercentage(0.5) == "50.0%");
    REQUIRE(StringUtils::formatPercentage(1.0, 0) == "100%");
}

TEST_CASE("validation and sanitising") {
    REQUIRE(StringUtils::isHex("deadBEEF09"));
    REQUIRE_FALSE(StringUtils::isHex("xyz"));
    REQUIRE_FALSE(StringUtils::isHex(""));

    REQUIRE(StringUtils::isUrl("https://example.test/a"));
    REQUIRE(StringUtils::isUrl("HTTP://example.test/a"));
    REQUIRE_FALSE(StringUtils::isUrl("ftp://example.test/a"));

    REQUIRE(StringUtils::sanitizeFileName("my file?.iso") == "my_file_.iso");
    REQUIRE(StringUtils::trim("  x \r\n") == "x");
    REQUIRE(StringUtils::equalsIgnoreCase("ABC", "abc"));
}
