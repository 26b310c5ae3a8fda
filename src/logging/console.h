#pragma once
#include <iosfwd>
#include <mutex>
#include <string>
#include <schema/leftover.h>

namespace logging {

// Line-oriented console output shared by all worker threads.
// Each call writes whole lines under one mutex so concurrent results never
// interleave. Errors always reach stderr; everything else honours the
// verbosity level.

enum class Verbosity {
    SILENT,
    NORMAL,
    VERBOSE
};

class Console {
public:
    /**
     * @brief Create a console writer
     * @param verbosity Output level
     * @param color Emit ANSI colour codes
     * @param out Stream for normal output (stdout by default)
     * @param err Stream for errors (stderr by default)
     */
    Console(Verbosity verbosity, bool color, std::ostream& out, std::ostream& err);
    Console(Verbosity verbosity, bool color);

    void info(const std::string& msg);
    void debug(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    /// Table header for result rows.
    void result_header();

    /// One result row, coloured by status class. Printed even when silent.
    void result(const Leftover& leftover);

    /// Overwriting progress line; verbose only.
    void progress(size_t processed, size_t accepted, int workers, double rps);

    /// ANSI colour for a status code ("" when colour is off).
    std::string status_color(long status) const;

    Verbosity verbosity() const { return verbosity_; }

private:
    Verbosity verbosity_;
    bool color_;
    std::ostream& out_;
    std::ostream& err_;
    bool progress_open_ = false;
    std::mutex mu_;

    void end_progress_locked();
    std::string paint(const std::string& text, const char* code) const;
};

/// Human-readable byte count ("512B", "1.5KB", "3.2MB").
std::string format_size(size_t bytes);

} // namespace logging
