#pragma once
#include <string>
#include <map>
#include <vector>

// HTTP client wrapper around libcurl.
// Issues one request per call with configurable timeouts, TLS policy,
// redirect handling and custom headers. Response bodies are streamed and
// only a bounded prefix is kept in memory.

// Probes are always GET: the body is needed for hashing and sniffing.
struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;             // at most Options::max_retained_bytes
    std::string effective_url;
    std::string error;
    double total_time = 0.0;      // seconds
    size_t body_bytes = 0;        // bytes received, not only retained
    long long declared_length = -1;
    bool truncated = false;       // transfer stopped at the large-file threshold
};

class HttpClient {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        bool verify_tls;
        std::string user_agent;
        bool accept_encoding;
        size_t max_retained_bytes;    // body prefix kept for hashing and sniffing
        size_t large_file_threshold;  // stop the transfer past this many bytes

        Options()
            : timeout_seconds(5),
              connect_timeout_seconds(5),
              follow_redirects(true),
              max_redirects(5),
              verify_tls(true),
              user_agent("residue/1.0"),
              accept_encoding(true),
              max_retained_bytes(64 * 1024),
              large_file_threshold(10 * 1024 * 1024)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, TLS, body limits)
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Issue a GET request and fill in the response
     * @param req URL and extra headers
     * @param resp Response object that gets populated
     * @return true if a response was received (including truncated ones),
     *         false on transport error (resp.error holds the cause)
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const;

    /**
     * @brief Case-insensitive lookup of a response header
     * @return Header value, or empty string if absent
     */
    static std::string header_value(const HttpResponse& resp, const std::string& name);

    const Options& options() const { return opts_; }

private:
    Options opts_;
};
