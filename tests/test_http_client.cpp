#include <catch2/catch.hpp>

#include "utils/HttpClient.hpp"

using namespace parafetch::utils;

TEST_CASE("header lines are split and normalised") {
    std::string name;
    std::string value;

    REQUIRE(HttpClient::parseHeaderLine("Content-Length: 1234\r\n", name, value));
    REQUIRE(name == "content-length");
    REQUIRE(value == "1234");

    REQUIRE(HttpClient::parseHeaderLine("ETag:\"abc:def\"\r\n", name, value));
    REQUIRE(name == "etag");
    REQUIRE(value == "\"abc:def\"");
}

TEST_CASE("status and blank lines are not headers") {
    std::string name;
    std::string value;

    REQUIRE_FALSE(HttpClient::parseHeaderLine("HTTP/1.1 206 Partial Content\r\n", name, value));
    REQUIRE_FALSE(HttpClient::parseHeaderLine("\r\n", name, value));
    REQUIRE_FALSE(HttpClient::parseHeaderLine(": no name\r\n", name, value));
}

TEST_CASE("response helpers") {
    HttpResponse response;
    response.statusCode = 206;
    response.headers["content-range"] = "bytes 0-3/10";

    REQUIRE(response.isSuccess());
    REQUIRE(response.isPartialContent());
    REQUIRE(response.header("content-range") == std::string("bytes 0-3/10"));
    REQUIRE_FALSE(response.header("etag"));

    REQUIRE_FALSE(response.hasTransportError());
    response.error = "Connection reset by peer";
    REQUIRE(response.hasTransportError());

    // Requested aborts are not transport failures
    response.aborted = true;
    REQUIRE_FALSE(response.hasTransportError());
}
