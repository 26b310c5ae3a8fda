// Target URL helpers built on the libcurl URL API

#include "url_utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <regex>
#include <set>
#include <sstream>

/// Convert string copy to lowercase using lambda on each character.
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

/// Read one URL part; returns empty string when the part is absent.
static std::string get_part(CURLU* h, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, 0) != CURLUE_OK || !value) return {};
    std::string out(value);
    curl_free(value);
    return out;
}

static std::string default_port(const std::string& scheme) {
    if (scheme == "http") return "80";
    if (scheme == "https") return "443";
    return {};
}

static std::string collapse_slashes(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    return out;
}

std::string TargetUrl::origin() const {
    std::string out = scheme + "://" + host;
    if (!port.empty()) out += ":" + port;
    return out;
}

std::string TargetUrl::directory() const {
    size_t n = segments.size();
    if (!file_name().empty()) n--;
    std::string dir = "/";
    for (size_t i = 0; i < n; i++) {
        dir += segments[i] + "/";
    }
    return dir;
}

std::string TargetUrl::file_name() const {
    if (segments.empty() || trailing_slash) return {};
    const std::string& last = segments.back();
    return last.find('.') != std::string::npos ? last : std::string();
}

std::string TargetUrl::path() const {
    std::string p;
    for (const auto& s : segments) p += "/" + s;
    if (p.empty() || trailing_slash) p += "/";
    return p;
}

bool parse_target_url(const std::string& url, TargetUrl& out) {
    std::string input = url;
    if (input.find("://") == std::string::npos) input = "http://" + input;

    CURLU* h = curl_url();
    if (!h) return false;
    if (curl_url_set(h, CURLUPART_URL, input.c_str(), 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return false;
    }

    out = TargetUrl();
    out.scheme = to_lower(get_part(h, CURLUPART_SCHEME));
    out.host = to_lower(get_part(h, CURLUPART_HOST));
    out.port = get_part(h, CURLUPART_PORT);
    std::string path = collapse_slashes(get_part(h, CURLUPART_PATH));
    curl_url_cleanup(h);

    if (out.host.empty()) return false;
    if (out.scheme != "http" && out.scheme != "https") return false;
    if (out.port == default_port(out.scheme)) out.port.clear();

    std::string seg;
    std::istringstream ss(path);
    while (std::getline(ss, seg, '/')) {
        if (!seg.empty()) out.segments.push_back(seg);
    }
    out.trailing_slash = path.size() > 1 && path.back() == '/';

    out.is_ip = is_ipv4(out.host);
    if (!out.is_ip) out.domain = split_domain(out.host);
    return true;
}

std::string normalize_url(const std::string& url) {
    CURLU* h = curl_url();
    if (!h) return url;
    if (curl_url_set(h, CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return url;
    }

    std::string scheme = to_lower(get_part(h, CURLUPART_SCHEME));
    std::string host = to_lower(get_part(h, CURLUPART_HOST));
    std::string port = get_part(h, CURLUPART_PORT);
    std::string path = collapse_slashes(get_part(h, CURLUPART_PATH));
    std::string query = get_part(h, CURLUPART_QUERY);
    curl_url_cleanup(h);

    std::string out = scheme + "://" + host;
    if (!port.empty() && port != default_port(scheme)) out += ":" + port;
    out += path.empty() ? "/" : path;
    if (!query.empty()) out += "?" + query;
    return out;
}

bool is_ipv4(const std::string& host) {
    static const std::regex ipv4_re(R"(^(\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3})$)");
    std::smatch m;
    if (!std::regex_match(host, m, ipv4_re)) return false;
    for (size_t i = 1; i < m.size(); i++) {
        if (std::stoi(m[i].str()) > 255) return false;
    }
    return true;
}

DomainParts split_domain(const std::string& host) {
    // Multi-label public suffixes; single-label TLDs are handled generically.
    static const std::set<std::string> multi_label = {
        "co.uk", "org.uk", "ac.uk", "gov.uk", "me.uk",
        "com.br", "net.br", "org.br", "gov.br", "edu.br", "mil.br", "art.br",
        "com.au", "net.au", "org.au", "edu.au", "gov.au",
        "co.nz", "co.jp", "co.kr", "co.za", "co.in",
        "com.ar", "com.mx", "com.co", "com.pe", "com.cn", "com.tr",
        "gob.mx", "gob.ar", "gov.in",
    };

    DomainParts parts;
    std::vector<std::string> labels;
    std::string label;
    std::istringstream ss(host);
    while (std::getline(ss, label, '.')) {
        if (!label.empty()) labels.push_back(label);
    }
    if (labels.empty()) return parts;
    if (labels.size() == 1) {
        parts.name = labels[0];
        return parts;
    }

    size_t suffix_labels = 1;
    if (labels.size() >= 3) {
        std::string tail = labels[labels.size() - 2] + "." + labels.back();
        if (multi_label.count(tail)) suffix_labels = 2;
    }

    size_t name_index = labels.size() - suffix_labels - 1;
    parts.name = labels[name_index];
    for (size_t i = name_index + 1; i < labels.size(); i++) {
        if (!parts.suffix.empty()) parts.suffix += ".";
        parts.suffix += labels[i];
    }
    parts.subdomains.assign(labels.begin(), labels.begin() + name_index);
    return parts;
}
