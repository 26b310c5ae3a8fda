/**
 * @file content_sniffer.cpp
 * @brief Error-page text sniffing using gumbo
 */

#include "content_sniffer.h"
#include <gumbo.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace sniff {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string media_type(const std::string& content_type) {
    std::string t = content_type.substr(0, content_type.find(';'));
    size_t b = t.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = t.find_last_not_of(" \t");
    return to_lower(t.substr(b, e - b + 1));
}

bool is_html(const std::string& content_type, const std::string& body) {
    std::string mt = media_type(content_type);
    if (mt == "text/html" || mt == "application/xhtml+xml") return true;
    if (!mt.empty()) return false;

    std::string head = to_lower(body.substr(0, 512));
    return head.find("<html") != std::string::npos || head.find("<!doctype html") != std::string::npos;
}

std::string visible_text(const std::string& html) {
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) return "";

    std::string text;
    std::vector<GumboNode*> stack;
    stack.push_back(output->root);
    while (!stack.empty()) {
        GumboNode* node = stack.back();
        stack.pop_back();

        if (node->type == GUMBO_NODE_TEXT) {
            std::string chunk(node->v.text.text);
            size_t b = chunk.find_first_not_of(" \t\r\n");
            if (b == std::string::npos) continue;
            size_t e = chunk.find_last_not_of(" \t\r\n");
            if (!text.empty()) text += ' ';
            text += chunk.substr(b, e - b + 1);
            continue;
        }
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        GumboTag tag = node->v.element.tag;
        if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT) continue;

        // Reverse push keeps document order when popping
        GumboVector* children = &node->v.element.children;
        for (unsigned int i = children->length; i-- > 0;) {
            GumboNode* child = static_cast<GumboNode*>(children->data[i]);
            if (child) stack.push_back(child);
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return text;
}

bool has_error_phrase(const std::string& text) {
    static const char* phrases[] = {
        "access denied", "forbidden", "not authorized", "unauthorized",
        "permission denied", "you don't have permission", "not allowed",
        "authentication required", "login required", "error 401", "error 403",
        "not found", "request blocked", "acesso negado", "proibido",
    };
    std::string lower = to_lower(text);
    for (const char* p : phrases) {
        if (lower.find(p) != std::string::npos) return true;
    }
    return false;
}

} // namespace sniff
