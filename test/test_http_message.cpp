#include <catch2/catch_test_macros.hpp>
#include "lanshare/http/message.h"

using namespace lanshare;

TEST_CASE("Range header parsing", "[http][range]") {
    SECTION("Open-ended range runs to the last byte") {
        auto r = parse_range_header("bytes=1000-", 5000);
        REQUIRE(r.status == RangeStatus::Valid);
        REQUIRE(r.start == 1000);
        REQUIRE(r.end == 4999);
        REQUIRE(r.length() == 4000);
    }

    SECTION("Closed range") {
        auto r = parse_range_header("bytes=0-1023", 5000);
        REQUIRE(r.status == RangeStatus::Valid);
        REQUIRE(r.start == 0);
        REQUIRE(r.end == 1023);
    }

    SECTION("Single byte at the end") {
        auto r = parse_range_header("bytes=4999-4999", 5000);
        REQUIRE(r.status == RangeStatus::Valid);
        REQUIRE(r.length() == 1);
    }

    SECTION("Start beyond the file is unsatisfiable") {
        REQUIRE(parse_range_header("bytes=6000-7000", 5000).status == RangeStatus::Unsatisfiable);
        REQUIRE(parse_range_header("bytes=5000-", 5000).status == RangeStatus::Unsatisfiable);
    }

    SECTION("Reversed range is unsatisfiable") {
        REQUIRE(parse_range_header("bytes=300-200", 5000).status == RangeStatus::Unsatisfiable);
    }

    SECTION("Any range on an empty file is unsatisfiable") {
        REQUIRE(parse_range_header("bytes=0-", 0).status == RangeStatus::Unsatisfiable);
    }

    SECTION("Malformed values") {
        REQUIRE(parse_range_header("bytes=abc-def", 5000).status == RangeStatus::Malformed);
        REQUIRE(parse_range_header("items=0-10", 5000).status == RangeStatus::Malformed);
        REQUIRE(parse_range_header("bytes=10", 5000).status == RangeStatus::Malformed);
        REQUIRE(parse_range_header("bytes=0-10-20", 5000).status == RangeStatus::Malformed);
        REQUIRE(parse_range_header("", 5000).status == RangeStatus::Malformed);
    }
}

TEST_CASE("Content-Range parsing", "[http][content-range]") {
    auto cr = parse_content_range("bytes 1000-4999/5000");
    REQUIRE(cr.has_value());
    REQUIRE(cr->start == 1000);
    REQUIRE(cr->end == 4999);
    REQUIRE(cr->total == std::optional<uint64_t>(5000));

    auto unknown_total = parse_content_range("bytes 0-9/*");
    REQUIRE(unknown_total.has_value());
    REQUIRE_FALSE(unknown_total->total.has_value());

    REQUIRE_FALSE(parse_content_range("bytes */5000").has_value());
    REQUIRE_FALSE(parse_content_range("bytes 9-0/10").has_value());
    REQUIRE_FALSE(parse_content_range("0-9/10").has_value());
}

TEST_CASE("Request head parsing", "[http][request]") {
    auto req = parse_request_head(
        "GET /files/a%20b?token=abc%2Bdef&x=1 HTTP/1.1\r\n"
        "Host: 10.0.0.2:8000\r\n"
        "Range: bytes=0-99\r\n"
        "Accept: text/html\r\n"
        "accept: application/json\r\n"
        "\r\n");
    REQUIRE(req.has_value());
    REQUIRE(req->method == "GET");
    REQUIRE(req->path == "/files/a b");
    REQUIRE(req->query == "token=abc%2Bdef&x=1");
    REQUIRE(req->version == "HTTP/1.1");
    REQUIRE(req->header("RANGE") == std::optional<std::string>("bytes=0-99"));
    REQUIRE(req->header("accept") == std::optional<std::string>("text/html, application/json"));
    REQUIRE(req->query_param("token") == std::optional<std::string>("abc+def"));
    REQUIRE(req->query_param("x") == std::optional<std::string>("1"));
    REQUIRE_FALSE(req->query_param("missing").has_value());

    REQUIRE_FALSE(parse_request_head("GARBAGE\r\n\r\n").has_value());
    REQUIRE_FALSE(parse_request_head("GET / FTP/1.0\r\n\r\n").has_value());
    REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n").has_value());
    REQUIRE_FALSE(parse_request_head("").has_value());
}

TEST_CASE("Response head parsing", "[http][response]") {
    auto resp = parse_response_head(
        "HTTP/1.1 206 Partial Content\r\n"
        "Content-Length: 100\r\n"
        "Content-Range: bytes 0-99/5000\r\n"
        "\r\n");
    REQUIRE(resp.has_value());
    REQUIRE(resp->status == 206);
    REQUIRE(resp->reason == "Partial Content");
    REQUIRE(resp->content_length() == std::optional<uint64_t>(100));
    REQUIRE(resp->header("content-range") == std::optional<std::string>("bytes 0-99/5000"));

    REQUIRE_FALSE(parse_response_head("ICY 200 OK\r\n\r\n").has_value());
    REQUIRE_FALSE(parse_response_head("HTTP/1.1 abc Nope\r\n\r\n").has_value());
}

TEST_CASE("URL parsing", "[http][url]") {
    auto url = HttpUrl::parse("http://192.168.1.20:8000/download/abc");
    REQUIRE(url.has_value());
    REQUIRE(url->host == "192.168.1.20");
    REQUIRE(url->port == 8000);
    REQUIRE(url->target == "/download/abc");
    REQUIRE(url->authority() == "192.168.1.20:8000");
    REQUIRE(url->to_string() == "http://192.168.1.20:8000/download/abc");

    auto bare = HttpUrl::parse("http://peer.local");
    REQUIRE(bare.has_value());
    REQUIRE(bare->port == 80);
    REQUIRE(bare->target == "/");
    REQUIRE(bare->authority() == "peer.local");

    REQUIRE_FALSE(HttpUrl::parse("https://secure/").has_value());
    REQUIRE_FALSE(HttpUrl::parse("http://host:0/").has_value());
    REQUIRE_FALSE(HttpUrl::parse("http://host:99999/").has_value());
    REQUIRE_FALSE(HttpUrl::parse("http:///path").has_value());
}

TEST_CASE("Small string helpers", "[http][util]") {
    REQUIRE(url_decode("a%20b+c") == "a b c");
    REQUIRE(url_decode("bad%zz") == "bad%zz");
    REQUIRE(to_lower("Content-TYPE") == "content-type");
    REQUIRE(status_reason(416) == "Requested Range Not Satisfiable");
    REQUIRE(status_reason(799) == "Unknown");
}
