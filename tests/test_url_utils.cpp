/**
 * @file test_url_utils.cpp
 * @brief Unit tests for target URL decomposition and normalization
 */

#include <catch2/catch.hpp>
#include "core/url_utils.h"

TEST_CASE("Target URLs are decomposed into origin, directory and file", "[url]") {
    TargetUrl t;

    SECTION("File target") {
        REQUIRE(parse_target_url("https://Shop.Example.com/app/login.php?x=1", t));
        REQUIRE(t.scheme == "https");
        REQUIRE(t.host == "shop.example.com");
        REQUIRE(t.port.empty());
        REQUIRE(t.origin() == "https://shop.example.com");
        REQUIRE(t.directory() == "/app/");
        REQUIRE(t.file_name() == "login.php");
        REQUIRE(t.path() == "/app/login.php");
    }

    SECTION("Directory without trailing slash") {
        REQUIRE(parse_target_url("http://example.com/app", t));
        REQUIRE(t.file_name().empty());
        REQUIRE(t.directory() == "/app/");
    }

    SECTION("Root") {
        REQUIRE(parse_target_url("http://example.com", t));
        REQUIRE(t.segments.empty());
        REQUIRE(t.directory() == "/");
        REQUIRE(t.path() == "/");
    }

    SECTION("Scheme is optional, default ports are dropped") {
        REQUIRE(parse_target_url("example.com:80/a//b/", t));
        REQUIRE(t.scheme == "http");
        REQUIRE(t.port.empty());
        REQUIRE(t.segments == std::vector<std::string>{"a", "b"});
        REQUIRE(t.trailing_slash);
        REQUIRE(t.directory() == "/a/b/");
    }

    SECTION("Non-default port is kept") {
        REQUIRE(parse_target_url("http://127.0.0.1:8080/", t));
        REQUIRE(t.origin() == "http://127.0.0.1:8080");
        REQUIRE(t.is_ip);
        REQUIRE(t.domain.name.empty());
    }
}

TEST_CASE("Malformed or unsupported targets are rejected", "[url]") {
    TargetUrl t;
    REQUIRE_FALSE(parse_target_url("", t));
    REQUIRE_FALSE(parse_target_url("ftp://example.com/", t));
    REQUIRE_FALSE(parse_target_url("http://", t));
}

TEST_CASE("Registrable domain split", "[url]") {
    SECTION("Single-label suffix") {
        auto d = split_domain("dev.api.example.com");
        REQUIRE(d.subdomains == std::vector<std::string>{"dev", "api"});
        REQUIRE(d.name == "example");
        REQUIRE(d.suffix == "com");
    }

    SECTION("Multi-label suffix") {
        auto d = split_domain("loja.exemplo.com.br");
        REQUIRE(d.subdomains == std::vector<std::string>{"loja"});
        REQUIRE(d.name == "exemplo");
        REQUIRE(d.suffix == "com.br");
    }

    SECTION("Bare multi-label registrable domain") {
        auto d = split_domain("example.co.uk");
        REQUIRE(d.subdomains.empty());
        REQUIRE(d.name == "example");
        REQUIRE(d.suffix == "co.uk");
    }

    SECTION("Single label host") {
        auto d = split_domain("localhost");
        REQUIRE(d.name == "localhost");
        REQUIRE(d.suffix.empty());
    }
}

TEST_CASE("IPv4 detection", "[url]") {
    REQUIRE(is_ipv4("10.0.0.1"));
    REQUIRE(is_ipv4("255.255.255.255"));
    REQUIRE_FALSE(is_ipv4("256.1.1.1"));
    REQUIRE_FALSE(is_ipv4("example.com"));
    REQUIRE_FALSE(is_ipv4("1.2.3"));
}

TEST_CASE("URL normalization for deduplication", "[url]") {
    REQUIRE(normalize_url("HTTP://Example.COM:80//a//b.bak#frag") == "http://example.com/a/b.bak");
    REQUIRE(normalize_url("https://example.com:443/") == "https://example.com/");
    REQUIRE(normalize_url("https://example.com:8443/x") == "https://example.com:8443/x");

    // Paths stay case-sensitive
    REQUIRE(normalize_url("http://example.com/README.bak") != normalize_url("http://example.com/readme.bak"));
}
