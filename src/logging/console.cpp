// Console output implementation

#include "console.h"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

static const char* kReset = "\033[0m";
static const char* kGreen = "\033[32m";
static const char* kYellow = "\033[33m";
static const char* kRed = "\033[31m";
static const char* kBlue = "\033[34m";
static const char* kDim = "\033[2m";

std::string format_size(size_t bytes) {
    std::ostringstream ss;
    if (bytes < 1024) {
        ss << bytes << "B";
    } else if (bytes < 1024 * 1024) {
        ss << std::fixed << std::setprecision(1) << bytes / 1024.0 << "KB";
    } else {
        ss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << "MB";
    }
    return ss.str();
}

Console::Console(Verbosity verbosity, bool color, std::ostream& out, std::ostream& err)
    : verbosity_(verbosity), color_(color), out_(out), err_(err) {}

Console::Console(Verbosity verbosity, bool color)
    : Console(verbosity, color, std::cout, std::cerr) {}

std::string Console::paint(const std::string& text, const char* code) const {
    if (!color_) return text;
    return std::string(code) + text + kReset;
}

std::string Console::status_color(long status) const {
    if (!color_) return "";
    if (status >= 200 && status < 300) return kGreen;
    if (status == 401 || status == 403) return kYellow;
    if (status >= 300 && status < 400) return kBlue;
    return kRed;
}

void Console::end_progress_locked() {
    if (progress_open_) {
        out_ << "\n";
        progress_open_ = false;
    }
}

void Console::info(const std::string& msg) {
    if (verbosity_ == Verbosity::SILENT) return;
    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    out_ << "[*] " << msg << "\n";
}

void Console::debug(const std::string& msg) {
    if (verbosity_ != Verbosity::VERBOSE) return;
    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    out_ << paint("[.] " + msg, kDim) << "\n";
}

void Console::warn(const std::string& msg) {
    if (verbosity_ == Verbosity::SILENT) return;
    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    err_ << paint("[!] " + msg, kYellow) << "\n";
}

void Console::error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    err_ << paint("[x] " + msg, kRed) << "\n";
}

void Console::result_header() {
    if (verbosity_ == Verbosity::SILENT) return;
    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    out_ << std::left << std::setw(8) << "STATUS" << std::setw(10) << "SIZE"
         << std::setw(12) << "CATEGORY" << std::setw(12) << "CONFIDENCE" << "URL\n";
}

void Console::result(const Leftover& leftover) {
    std::ostringstream row;
    row << std::left << std::setw(8) << leftover.status
        << std::setw(10) << format_size(leftover.size)
        << std::setw(12) << leftover.candidate.category
        << std::setw(12) << confidence_name(leftover.confidence)
        << leftover.candidate.url;
    if (leftover.partial_analysis) row << " (partial)";
    if (!leftover.content_type.empty() && verbosity_ == Verbosity::VERBOSE) {
        row << " [" << leftover.content_type << "]";
    }

    std::lock_guard<std::mutex> lock(mu_);
    end_progress_locked();
    std::string line = row.str();
    if (color_) line = status_color(leftover.status) + line + kReset;
    out_ << line << "\n";
    out_.flush();
}

void Console::progress(size_t processed, size_t accepted, int workers, double rps) {
    if (verbosity_ != Verbosity::VERBOSE) return;
    std::lock_guard<std::mutex> lock(mu_);
    out_ << "\r[~] " << processed << " probed, " << accepted << " found, "
         << workers << " workers, " << std::fixed << std::setprecision(1) << rps << " req/s";
    out_.flush();
    progress_open_ = true;
}

} // namespace logging
