#pragma once
#include "http_client.h"
#include <atomic>
#include <map>
#include <string>
#include <vector>

// Single-request probing.
// A probe turns one candidate URL into a normalized ProbeOutcome: status,
// size, a bounded content sample, a content hash and timing. Transport
// failures are carried in the outcome, never thrown.

struct ProbeOutcome {
    long status = 0;
    size_t size = 0;
    std::string sample;          // bounded prefix for text sniffing
    std::string content_hash;    // sha256 of the retained prefix, "" for empty bodies
    std::string content_type;
    std::string effective_url;
    double elapsed_ms = 0.0;
    std::string transport_error; // non-empty when no response was received
    bool partial_analysis = false;
    bool partial_content = false;

    bool ok() const { return transport_error.empty(); }
};

/**
 * @brief Hash a body prefix the way outcomes are hashed
 * @param data Retained body bytes
 * @return "sha256:<hex>", or empty string for empty input
 */
std::string content_hash(const std::string& data);

// Issues probes. Implementations must be safe to call from many workers.
class ProbeExecutor {
public:
    virtual ~ProbeExecutor() = default;

    /**
     * @brief Fetch one URL and normalize the response
     * @param url Absolute candidate URL
     * @return Outcome; transport_error set if the request failed
     */
    virtual ProbeOutcome probe(const std::string& url) = 0;
};

class HttpProbeExecutor : public ProbeExecutor {
public:
    struct Options {
        std::map<std::string, std::string> headers;  // override the browser-like defaults
        std::string cookie;
        std::vector<std::string> user_agents;        // first entry used unless rotating
        bool rotate_user_agent;
        size_t sample_bytes;

        Options()
            : rotate_user_agent(false),
              sample_bytes(4096)
        {}
    };

    /**
     * @brief Create a probe executor on top of an HTTP client
     * @param client Shared client (timeouts, TLS and body limits live there)
     * @param opts Header and User-Agent policy
     */
    HttpProbeExecutor(const HttpClient& client, const Options& opts = Options());

    ProbeOutcome probe(const std::string& url) override;

    /// Built-in browser User-Agent strings used for rotation.
    static const std::vector<std::string>& builtin_user_agents();

private:
    const HttpClient& client_;
    Options opts_;
    std::atomic<size_t> agent_index_{0};

    std::string next_user_agent();
};
