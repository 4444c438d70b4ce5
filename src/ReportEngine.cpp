#include "ReportEngine.h"

#include "SynthraExceptions.h"

#include <algorithm>
#include <fstream>

namespace {
constexpr size_t kTallTableRowCap = 120;

std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows,
                         size_t rowLimit) {
    body += "|";
    for (const auto& h : headers) body += " " + escapeMarkdownTableCell(h) + " |";
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) body += " --- |";
    body += "\n";

    const size_t shown = std::min(rowLimit, rows.size());
    for (size_t r = 0; r < shown; ++r) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < rows[r].size() ? rows[r][i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "### " + title + "\n\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    if (rows.empty()) {
        body_ += "_No rows._\n\n";
        return;
    }
    if (rows.size() > kTallTableRowCap) {
        body_ += "_Showing " + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows._\n\n";
    }
    appendMarkdownTable(body_, headers, rows, kTallTableRowCap);
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) throw Synthra::IOException("Could not write report: " + filePath);
    out << body_;
    if (!out) throw Synthra::IOException("Failed while writing report: " + filePath);
}
