/**
 * @file http_client.cpp
 * @brief Lightweight HTTP client using libcurl
 */

#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>
#include <string_view>
#include <algorithm>
#include <cctype>

namespace {

// Per-transfer state shared by the write and header callbacks.
struct Transfer {
    std::string body;
    size_t received = 0;
    size_t retain_limit = 0;
    size_t abort_after = 0;
    long long declared_length = -1;
    bool truncated = false;
    std::vector<std::pair<std::string, std::string>> headers;
};

/// Callback invoked by libcurl to write the received body data.
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = size * nmemb;

    if (t->body.size() < t->retain_limit) {
        size_t keep = std::min(n, t->retain_limit - t->body.size());
        t->body.append(ptr, keep);
    }
    t->received += n;

    // A declared oversized body is cut as soon as the prefix is full.
    bool declared_large = t->declared_length >= 0 &&
                          static_cast<size_t>(t->declared_length) > t->abort_after;
    if ((declared_large && t->body.size() >= t->retain_limit) || t->received > t->abort_after) {
        t->truncated = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return n;
}

/// Callback invoked once per header line to parse header into the list.
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* t = static_cast<Transfer*>(userdata);

    // A new status line starts a new header block (redirect hops).
    if (hv.rfind("HTTP/", 0) == 0) {
        t->headers.clear();
        t->declared_length = -1;
        return total;
    }

    auto pos = hv.find(':');
    if (pos != std::string_view::npos) {
        std::string name(hv.substr(0, pos));

        size_t val_start = pos + 1;
        while (val_start < hv.size() && (hv[val_start] == ' ' || hv[val_start] == '\t'))
            val_start++;

        size_t val_end = hv.size();
        while (val_end > val_start && (hv[val_end - 1] == '\r' || hv[val_end - 1] == '\n'))
            val_end--;
        std::string value(hv.substr(val_start, val_end - val_start));

        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

        if (name == "content-length") {
            try {
                t->declared_length = std::stoll(value);
            } catch (const std::exception&) {
                t->declared_length = -1;
            }
        }
        t->headers.emplace_back(std::move(name), std::move(value));
    }
    return total;
}

} // namespace

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

/// Execute an HTTP request and populate a response object.
bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return false;
    }

    Transfer transfer;
    transfer.retain_limit = std::min(opts_.max_retained_bytes, opts_.large_file_threshold);
    transfer.abort_after = opts_.large_file_threshold;

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);

    // TLS policy
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts_.verify_tls ? 2L : 0L);

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers; a User-Agent header overrides the default one
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    // Perform request; a write abort caused by truncation still counts as a response
    CURLcode rc = curl_easy_perform(curl);
    bool ok = rc == CURLE_OK || (rc == CURLE_WRITE_ERROR && transfer.truncated);
    if (!ok) {
        resp.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
    }

    // Extract response info
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) resp.effective_url = effective_url;

    double total_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);

    // Populate response
    resp.total_time = total_time;
    resp.body = std::move(transfer.body);
    resp.body_bytes = transfer.received;
    resp.declared_length = transfer.declared_length;
    resp.truncated = transfer.truncated;
    resp.headers = std::move(transfer.headers);

    // Cleanup
    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return ok;
}

/// Find a header by name, ignoring case.
std::string HttpClient::header_value(const HttpResponse& resp, const std::string& name) {
    std::string lname = name;
    std::transform(lname.begin(), lname.end(), lname.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const auto& [k, v] : resp.headers) {
        if (k == lname) return v;
    }
    return "";
}
