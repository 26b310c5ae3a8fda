#include "fake_target.h"
#include <algorithm>
#include <chrono>
#include <thread>

FakeResponse not_found_page() {
    FakeResponse r;
    r.status = 404;
    r.body = "<html><head><title>404 Not Found</title></head>"
             "<body><h1>Not Found</h1><p>The requested URL was not found on this server.</p></body></html>";
    r.content_type = "text/html";
    return r;
}

FakeTarget::FakeTarget() : FakeTarget(not_found_page()) {}

FakeTarget::FakeTarget(const FakeResponse& not_found)
    : not_found_([not_found](const std::string&) { return not_found; }) {}

void FakeTarget::add(const std::string& path, const FakeResponse& response) {
    std::lock_guard<std::mutex> lock(mu_);
    routes_[path] = response;
}

void FakeTarget::set_not_found(Generator generator) {
    std::lock_guard<std::mutex> lock(mu_);
    not_found_ = std::move(generator);
}

std::string FakeTarget::path_of(const std::string& url) {
    std::string rest = url;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
    auto slash = rest.find('/');
    if (slash == std::string::npos) return "/";
    rest = rest.substr(slash);
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest = rest.substr(0, hash);
    return rest;
}

ProbeOutcome FakeTarget::probe(const std::string& url) {
    const std::string path = path_of(url);
    FakeResponse r;
    {
        std::lock_guard<std::mutex> lock(mu_);
        requests_.push_back(path);
        times_.push_back(std::chrono::steady_clock::now());
        auto it = routes_.find(path);
        r = it != routes_.end() ? it->second : not_found_(path);
    }
    if (sleep_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));

    ProbeOutcome out;
    out.effective_url = r.redirect_to.empty() ? url : r.redirect_to;
    out.elapsed_ms = latency_ms_ >= 0.0 ? latency_ms_ : r.latency_ms;
    if (!r.transport_error.empty()) {
        out.transport_error = r.transport_error;
        return out;
    }

    out.status = r.status;
    out.size = r.body.size();
    out.sample = r.body.substr(0, std::min<size_t>(r.body.size(), 4096));
    out.content_hash = content_hash(r.body);
    out.content_type = r.content_type;
    out.partial_content = r.status == 206;
    return out;
}

std::vector<std::string> FakeTarget::requested_paths() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
}

std::vector<std::chrono::steady_clock::time_point> FakeTarget::request_times() const {
    std::lock_guard<std::mutex> lock(mu_);
    return times_;
}

size_t FakeTarget::request_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_.size();
}

bool FakeTarget::was_requested(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::find(requests_.begin(), requests_.end(), path) != requests_.end();
}
