/**
 * @file probe_executor.cpp
 * @brief HTTP probe executor built on HttpClient
 */

#include "probe_executor.h"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>

/// Hash string using sha256.
std::string content_hash(const std::string& data) {
    if (data.empty()) return "";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream ss;
    ss << "sha256:";
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

const std::vector<std::string>& HttpProbeExecutor::builtin_user_agents() {
    static const std::vector<std::string> agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.1 Safari/605.1.15",
        "Mozilla/5.0 (X11; Linux x86_64; rv:121.0) Gecko/20100101 Firefox/121.0",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:121.0) Gecko/20100101 Firefox/121.0",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36 Edg/120.0.0.0",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 17_1 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.1 Mobile/15E148 Safari/604.1",
    };
    return agents;
}

HttpProbeExecutor::HttpProbeExecutor(const HttpClient& client, const Options& opts)
    : client_(client), opts_(opts) {}

/// Pick the User-Agent for the next request.
std::string HttpProbeExecutor::next_user_agent() {
    const auto& pool = opts_.user_agents.empty() ? builtin_user_agents() : opts_.user_agents;
    if (!opts_.rotate_user_agent) {
        return opts_.user_agents.empty() ? client_.options().user_agent : pool.front();
    }
    size_t i = agent_index_.fetch_add(1, std::memory_order_relaxed);
    return pool[i % pool.size()];
}

ProbeOutcome HttpProbeExecutor::probe(const std::string& url) {
    HttpRequest req;
    req.url = url;
    req.headers["Accept"] = "*/*";
    req.headers["Accept-Language"] = "en-US,en;q=0.9";
    req.headers["Cache-Control"] = "no-cache";
    req.headers["Pragma"] = "no-cache";
    req.headers["User-Agent"] = next_user_agent();
    if (!opts_.cookie.empty()) req.headers["Cookie"] = opts_.cookie;
    for (const auto& [name, value] : opts_.headers) {
        req.headers[name] = value;
    }

    HttpResponse resp;
    ProbeOutcome out;
    bool ok = client_.perform(req, resp);
    out.elapsed_ms = resp.total_time * 1000.0;
    if (!ok) {
        out.transport_error = resp.error.empty() ? "request failed" : resp.error;
        return out;
    }

    out.status = resp.status;
    out.effective_url = resp.effective_url;
    out.content_type = HttpClient::header_value(resp, "content-type");
    out.partial_analysis = resp.truncated;
    out.partial_content = resp.status == 206;

    if (resp.truncated && resp.declared_length >= 0) {
        out.size = static_cast<size_t>(resp.declared_length);
    } else {
        out.size = resp.body_bytes;
    }

    out.content_hash = content_hash(resp.body);
    out.sample = resp.body.substr(0, opts_.sample_bytes);
    return out;
}
