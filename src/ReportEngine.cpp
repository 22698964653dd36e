#include "ReportEngine.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {
// Rows past this count are folded into a collapsible block.
constexpr size_t kVisibleRows = 120;

// Pipes would split the cell; line breaks would end the table row.
std::string tableCell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') out += "\\|";
        else if (c == '\n') out += ' ';
        else if (c != '\r') out += c;
    }
    return out;
}

std::string tableRow(const std::vector<std::string>& cells, size_t width) {
    std::string line = "|";
    for (size_t c = 0; c < width; ++c) line += " " + (c < cells.size() ? tableCell(cells[c]) : std::string()) + " |";
    return line + "\n";
}

std::string tableHead(const std::vector<std::string>& headers) {
    std::string rule = "|";
    for (size_t c = 0; c < headers.size(); ++c) rule += " --- |";
    return tableRow(headers, headers.size()) + rule + "\n";
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    if (!title.empty()) body_ += "### " + title + "\n\n";
    if (headers.empty()) return;

    body_ += tableHead(headers);
    const size_t visible = std::min(rows.size(), kVisibleRows);
    for (size_t r = 0; r < visible; ++r) body_ += tableRow(rows[r], headers.size());
    body_ += "\n";
    if (visible == rows.size()) return;

    body_ += "<details>\n<summary>" + std::to_string(rows.size() - visible) + " more rows</summary>\n\n";
    body_ += tableHead(headers);
    for (size_t r = visible; r < rows.size(); ++r) body_ += tableRow(rows[r], headers.size());
    body_ += "\n</details>\n\n";
}

void ReportEngine::addList(const std::vector<std::string>& items, bool numbered) {
    size_t n = 0;
    for (const auto& item : items) {
        body_ += numbered ? std::to_string(++n) + ". " : std::string("- ");
        body_ += item + "\n";
    }
    body_ += "\n";
}

void ReportEngine::save(const std::string& filePath) const {
    namespace fs = std::filesystem;
    const fs::path target(filePath);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    if (ec) throw Survex::IOException("Could not create report directory " + target.parent_path().string() + ": " + ec.message());

    std::ofstream out(filePath, std::ios::binary);
    out << body_;
    out.flush();
    if (!out) throw Survex::IOException("Could not write report: " + filePath);
}
