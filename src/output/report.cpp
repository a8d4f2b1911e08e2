// ==============================================================================
// report.cpp - HTML-отчёт "до/после"
// ==============================================================================

#include "logveil/report.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace logveil::report {

namespace {

constexpr const char* PAGE_HEAD =
    "<!DOCTYPE html>\n"
    "<html>\n"
    "<head>\n"
    "<meta charset=\"utf-8\">\n"
    "<title>logveil redaction report</title>\n"
    "<style>\n"
    "body { font-family: sans-serif; }\n"
    "table.diff { border-collapse: collapse; width: 100%; margin-bottom: 2em; }\n"
    "table.diff td, table.diff th { border: 1px solid #ccc; padding: 2px 6px; }\n"
    "table.diff td { font-family: monospace; white-space: pre-wrap; }\n"
    "td.line { color: #888; text-align: right; }\n"
    "td.before { background: #fdd; }\n"
    "td.after { background: #dfd; }\n"
    "</style>\n"
    "</head>\n"
    "<body>\n";

constexpr const char* PAGE_TAIL =
    "</body>\n"
    "</html>\n";

void render_section(std::string& out, const DiffSection& section) {
    out += "<h2>";
    out += html_escape(section.title);
    out += "</h2>\n";
    out += "<table class=\"diff\">\n";
    out += "<tr><th>Line</th><th>Original</th><th>Sanitized</th></tr>\n";
    for (const auto& row : section.rows) {
        out += "<tr><td class=\"line\">";
        if (row.line.has_value()) {
            out += std::to_string(*row.line);
        }
        out += "</td><td class=\"before\">";
        out += html_escape(row.before);
        out += "</td><td class=\"after\">";
        out += html_escape(row.after);
        out += "</td></tr>\n";
    }
    out += "</table>\n";
}

}  // namespace

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string render_html(const std::vector<DiffSection>& sections) {
    std::string out = PAGE_HEAD;
    out += "<h1>Redaction report</h1>\n";

    std::size_t shown = 0;
    for (const auto& section : sections) {
        if (section.rows.empty()) {
            continue;
        }
        render_section(out, section);
        ++shown;
    }
    if (shown == 0) {
        out += "<p>No lines were changed.</p>\n";
    }

    out += PAGE_TAIL;
    return out;
}

bool write_html(const std::filesystem::path& path, const std::vector<DiffSection>& sections,
                std::string* error) {
    std::string body = render_html(sections);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (error != nullptr) {
            *error = "failed to open report file " + path.string() + ": " + std::strerror(errno);
        }
        return false;
    }
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out) {
        if (error != nullptr) {
            *error = "failed to write report file " + path.string();
        }
        return false;
    }
    return true;
}

}  // namespace logveil::report
