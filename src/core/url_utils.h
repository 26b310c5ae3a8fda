#pragma once
#include <string>
#include <vector>

// Target URL decomposition and normalization.

struct DomainParts {
    std::vector<std::string> subdomains;  // left to right, e.g. {"dev", "api"}
    std::string name;                     // registrable label, e.g. "example"
    std::string suffix;                   // public suffix, e.g. "com.br"
};

struct TargetUrl {
    std::string scheme;
    std::string host;
    std::string port;                     // empty when default for the scheme
    std::vector<std::string> segments;    // path segments without slashes
    bool trailing_slash = false;
    bool is_ip = false;
    DomainParts domain;

    /// scheme://host[:port]
    std::string origin() const;

    /// Directory the target points at, always starting and ending with '/'.
    std::string directory() const;

    /// Last path segment when it looks like a file (contains a dot), else "".
    std::string file_name() const;

    /// Full path as given, without query or fragment ("/" when empty).
    std::string path() const;
};

/**
 * @brief Parse a base URL with the libcurl URL API
 * @param url Target URL; "http://" is assumed when no scheme is given
 * @param out Populated decomposition
 * @return false if the URL cannot be parsed or has no host
 */
bool parse_target_url(const std::string& url, TargetUrl& out);

/**
 * @brief Normalize a URL for deduplication
 * @param url Absolute URL
 * @return URL with lowercase scheme/host, default port and fragment dropped
 *         and repeated slashes collapsed; input unchanged if unparseable
 */
std::string normalize_url(const std::string& url);

/// True for dotted-quad IPv4 literals.
bool is_ipv4(const std::string& host);

/**
 * @brief Split a hostname into subdomains, registrable name and suffix
 * @param host Lowercase hostname
 */
DomainParts split_domain(const std::string& host);
