/**
 * @file test_http_client.cpp
 * @brief Unit tests for the libcurl wrapper and probe normalization
 */

#include <catch2/catch.hpp>
#include "core/http_client.h"
#include "core/probe_executor.h"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

static std::string write_body_file(const std::string& name, size_t bytes) {
    std::string body;
    body.reserve(bytes);
    for (size_t i = 0; body.size() < bytes; i++) {
        body += "line " + std::to_string(i) + " of a forgotten database dump\n";
    }
    body.resize(bytes);

    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body;
    return path.string();
}

TEST_CASE("Header lookup ignores case", "[http]") {
    HttpResponse resp;
    resp.headers.push_back({"content-type", "text/html; charset=utf-8"});
    resp.headers.push_back({"x-powered-by", "PHP/8.1"});

    REQUIRE(HttpClient::header_value(resp, "Content-Type") == "text/html; charset=utf-8");
    REQUIRE(HttpClient::header_value(resp, "X-POWERED-BY") == "PHP/8.1");
    REQUIRE(HttpClient::header_value(resp, "Server").empty());
}

TEST_CASE("Content hashes are prefixed sha256", "[http]") {
    REQUIRE(content_hash("").empty());
    REQUIRE(content_hash("abc") ==
            "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(content_hash("abc") != content_hash("abd"));
}

TEST_CASE("Unreachable target yields a transport error", "[http]") {
    HttpClient::Options copts;
    copts.timeout_seconds = 2;
    copts.connect_timeout_seconds = 2;
    HttpClient client(copts);
    HttpProbeExecutor executor(client);

    // Port 1 on loopback refuses connections
    ProbeOutcome out = executor.probe("http://127.0.0.1:1/backup.zip");
    REQUIRE_FALSE(out.ok());
    REQUIRE_FALSE(out.transport_error.empty());
    REQUIRE(out.status == 0);
    REQUIRE(out.content_hash.empty());
}

TEST_CASE("Bodies past the large-file threshold are cut short", "[http]") {
    HttpClient::Options copts;
    copts.large_file_threshold = 100000;
    copts.max_retained_bytes = 4096;
    HttpClient client(copts);
    HttpProbeExecutor executor(client);

    SECTION("Oversized body") {
        const std::string path = write_body_file("residue_large_body.bin", 200000);
        std::string body;
        {
            std::ifstream in(path, std::ios::binary);
            body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
        REQUIRE(body.size() == 200000);

        HttpRequest req;
        req.url = "file://" + path;
        HttpResponse resp;
        REQUIRE(client.perform(req, resp));
        REQUIRE(resp.truncated);
        REQUIRE(resp.body == body.substr(0, 4096));

        ProbeOutcome out = executor.probe("file://" + path);
        REQUIRE(out.ok());
        REQUIRE(out.partial_analysis);
        REQUIRE(out.size > 100000);
        REQUIRE(out.size <= 200000);
        // Only the retained prefix is hashed
        REQUIRE(out.content_hash == content_hash(body.substr(0, 4096)));
        REQUIRE(out.sample == body.substr(0, 4096));

        fs::remove(path);
    }

    SECTION("Body under the threshold is read whole") {
        const std::string path = write_body_file("residue_small_body.bin", 1000);

        ProbeOutcome out = executor.probe("file://" + path);
        REQUIRE(out.ok());
        REQUIRE_FALSE(out.partial_analysis);
        REQUIRE(out.size == 1000);
        REQUIRE(out.content_hash.rfind("sha256:", 0) == 0);

        fs::remove(path);
    }
}

TEST_CASE("Built-in User-Agent pool", "[http]") {
    const auto& agents = HttpProbeExecutor::builtin_user_agents();
    REQUIRE(agents.size() >= 2);
    for (const auto& ua : agents) {
        REQUIRE(ua.rfind("Mozilla/5.0", 0) == 0);
    }
}
