#pragma once
#include <string>

// Lightweight body inspection used by the strict 401/403 heuristics.
// HTML is parsed with gumbo; everything else is treated as plain text.

namespace sniff {

/**
 * @brief Decide whether a body should be parsed as HTML
 * @param content_type Response Content-Type header (may be empty)
 * @param body Body sample
 */
bool is_html(const std::string& content_type, const std::string& body);

/**
 * @brief Extract the human-visible text of an HTML document
 * @param html HTML source (may be truncated)
 * @return Text nodes joined by single spaces, script and style skipped
 */
std::string visible_text(const std::string& html);

/**
 * @brief Check text for stock access-denied / error page phrases
 * @param text Plain text, any case
 */
bool has_error_phrase(const std::string& text);

/// Base media type of a Content-Type value: "Text/HTML; charset=x" -> "text/html".
std::string media_type(const std::string& content_type);

} // namespace sniff
