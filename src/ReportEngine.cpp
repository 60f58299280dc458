#include "ReportEngine.h"
#include "VeilExceptions.h"
#include <fstream>

namespace {
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

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
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
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (tallTable) {
        body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    }

    const size_t previewCount = tallTable ? kTallTableRowCap : rows.size();
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(previewCount));
    appendMarkdownTable(body_, headers, previewRows);

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
        appendMarkdownTable(body_, headers, rows);
        body_ += "</details>\n\n";
    }
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath, std::ios::binary);
    if (!out) throw Veil::IOException("Could not open report file for writing: " + filePath);
    out << body_;
    if (!out.good()) throw Veil::IOException("Failed while writing report file: " + filePath);
}
