#include "code_sentinel/format/console_formatter.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace code_sentinel {
namespace format {

namespace {

const char* RESET = "\033[0m";
const char* TITLE = "\033[1;38;2;25;118;210m";
const char* BOLD = "\033[1m";
const char* DIM = "\033[2m";

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string formatSeconds(std::chrono::milliseconds ms) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(ms.count()) / 1000.0 << "s";
    return out.str();
}

std::string joinIds(const std::vector<std::string>& ids) {
    std::string result;
    for (const auto& id : ids) {
        if (!result.empty()) result += ",";
        result += id;
    }
    return result;
}

}

TableRenderer::TableRenderer(bool use_colors) : use_colors_(use_colors) {}

void TableRenderer::addRow(const TableRow& row) {
    rows_.push_back(row);
}

std::string TableRenderer::render() {
    if (rows_.empty()) return "";

    calculateColumnWidths();
    std::ostringstream output;
    output << renderBorder("┌", "┬", "┐");

    for (size_t row_idx = 0; row_idx < rows_.size(); ++row_idx) {
        const auto& row = rows_[row_idx];
        output << "│";
        for (size_t col = 0; col < column_widths_.size(); ++col) {
            TableCell cell = col < row.cells.size() ? row.cells[col] : TableCell{};
            std::string content = fitCell(cell);
            int padding = std::max(0, column_widths_[col] - getDisplayWidth(content));
            std::string text = content + std::string(static_cast<size_t>(padding), ' ');
            if (row.is_header) {
                text = colorize(text, BOLD);
            } else {
                text = colorize(text, cell.fg_color);
            }
            output << " " << text << " │";
        }
        output << "\n";

        if (row.is_header && row_idx + 1 < rows_.size()) {
            output << renderBorder("├", "┼", "┤");
        }
    }

    output << renderBorder("└", "┴", "┘");
    return output.str();
}

void TableRenderer::calculateColumnWidths() {
    column_widths_.clear();
    for (const auto& row : rows_) {
        if (row.cells.size() > column_widths_.size()) {
            column_widths_.resize(row.cells.size(), 0);
        }
        for (size_t i = 0; i < row.cells.size(); ++i) {
            column_widths_[i] = std::max(column_widths_[i], getDisplayWidth(fitCell(row.cells[i])));
        }
    }
}

std::string TableRenderer::renderBorder(const std::string& left, const std::string& middle,
                                        const std::string& right) const {
    std::string border = left;
    for (size_t i = 0; i < column_widths_.size(); ++i) {
        for (int k = 0; k < column_widths_[i] + 2; ++k) {
            border += "─";
        }
        border += (i + 1 < column_widths_.size()) ? middle : right;
    }
    return border + "\n";
}

std::string TableRenderer::fitCell(const TableCell& cell) const {
    if (cell.max_width <= 3 || getDisplayWidth(cell.content) <= cell.max_width) {
        return cell.content;
    }
    return cell.content.substr(0, static_cast<size_t>(cell.max_width - 3)) + "...";
}

std::string TableRenderer::colorize(const std::string& text, const std::string& color_code) const {
    if (!use_colors_ || color_code.empty()) return text;
    return color_code + text + RESET;
}

// Counts code points; box and text content here is never double width.
int TableRenderer::getDisplayWidth(const std::string& text) {
    int width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

ConsoleFormatter::ConsoleFormatter(bool use_colors, size_t max_issues)
    : use_colors_(use_colors && isatty(STDOUT_FILENO)), max_issues_(max_issues) {}

std::string ConsoleFormatter::getSeverityColor(common::Severity severity) {
    switch (severity) {
        case common::Severity::CRITICAL: return "\033[31;1m";
        case common::Severity::HIGH: return "\033[31m";
        case common::Severity::MEDIUM: return "\033[33m";
        case common::Severity::LOW: return "\033[36m";
        case common::Severity::INFO: return "\033[37m";
    }
    return "";
}

std::string ConsoleFormatter::getGradeColor(const std::string& grade) {
    if (grade.empty()) return "";
    switch (grade[0]) {
        case 'A': return "\033[32;1m";
        case 'B': return "\033[32m";
        case 'C': return "\033[33m";
        case 'D': return "\033[33;1m";
        default: return "\033[31;1m";
    }
}

void ConsoleFormatter::format(const report::Report& report, std::ostream& out) {
    formatOverview(report, out);
    out << "\n";
    formatSeverityTable(report, out);
    out << "\n";
    formatAnalyzerTable(report, out);

    if (!report.issues.empty()) {
        out << "\n";
        formatIssues(report, out);
    }
    if (!report.summary.top_problematic_files.empty()) {
        out << "\n";
        formatTopFiles(report, out);
    }
    out << "\n";
    formatRecommendations(report, out);
}

void ConsoleFormatter::formatOverview(const report::Report& report, std::ostream& out) {
    const auto& summary = report.summary;
    out << colorize("Analysis Summary", TITLE) << "\n\n";

    std::string status = upper(common::to_string(report.status));
    if (summary.partial) {
        status += " (partial, cancelled)";
    }
    out << "  Status:          "
        << colorize(status, report.status == common::ReportStatus::COMPLETED ? "\033[32m" : "\033[31;1m") << "\n";
    out << "  Files analyzed:  " << report.files_analyzed << "\n";
    out << "  Issues:          " << report.total_issues << "\n";
    out << "  Score:           " << colorize(std::to_string(summary.overall_score) + "/100  grade " + summary.grade,
                                             getGradeColor(summary.grade)) << "\n";
    if (summary.dropped_findings > 0) {
        out << "  Dropped:         " << summary.dropped_findings << " malformed finding(s)\n";
    }
    out << "  Duration:        " << formatSeconds(report.timing.total_duration) << "\n";
}

void ConsoleFormatter::formatSeverityTable(const report::Report& report, std::ostream& out) {
    TableRenderer table(use_colors_);
    table.addRow({{{"Severity"}, {"Issues"}}, true});
    for (const auto& [severity, count] : report.summary.by_severity) {
        table.addRow({{{upper(common::to_string(severity)), getSeverityColor(severity)},
                       {std::to_string(count)}}});
    }
    out << table.render();
}

void ConsoleFormatter::formatAnalyzerTable(const report::Report& report, std::ostream& out) {
    out << colorize("Analyzers", BOLD) << "\n";

    TableRenderer table(use_colors_);
    table.addRow({{{"Analyzer"}, {"Files"}, {"Findings"}, {"Failures"}, {"Timeouts"}, {"Time"}}, true});
    for (const auto& [id, stats] : report.per_analyzer_stats) {
        std::string failure_color = stats.failures > 0 ? "\033[31m" : "";
        std::string timeout_color = stats.timeouts > 0 ? "\033[33m" : "";
        table.addRow({{
            {id},
            {std::to_string(stats.files_processed)},
            {std::to_string(stats.findings_contributed)},
            {std::to_string(stats.failures), failure_color},
            {std::to_string(stats.timeouts), timeout_color},
            {formatSeconds(stats.total_execution_time)}
        }});
    }
    out << table.render();
}

void ConsoleFormatter::formatIssues(const report::Report& report, std::ostream& out) {
    out << colorize("Issues", BOLD) << "\n";

    size_t shown = std::min(max_issues_, report.issues.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& issue = report.issues[i];
        const auto& finding = issue.finding;
        auto severity = *finding.severity;

        std::string location = finding.file_path;
        if (finding.line) {
            location += ":" + std::to_string(*finding.line);
        }

        std::ostringstream label;
        label << std::left << std::setw(10) << ("[" + upper(common::to_string(severity)) + "]");
        out << "  " << colorize(label.str(), getSeverityColor(severity)) << location << "  " << finding.title;
        if (!finding.rule_id.empty()) {
            out << colorize(" (" + finding.rule_id + ")", DIM);
        }
        out << colorize("  [" + joinIds(issue.detected_by) + "]", DIM) << "\n";
        if (!finding.suggestion.empty()) {
            out << "            " << colorize(finding.suggestion, DIM) << "\n";
        }
    }
    if (report.issues.size() > shown) {
        out << "  ... and " << (report.issues.size() - shown) << " more (use --json for the full list)\n";
    }
}

void ConsoleFormatter::formatTopFiles(const report::Report& report, std::ostream& out) {
    out << colorize("Top problematic files", BOLD) << "\n";

    TableRenderer table(use_colors_);
    table.addRow({{{"File"}, {"Issues"}, {"Worst"}}, true});
    for (const auto& file : report.summary.top_problematic_files) {
        table.addRow({{
            {file.file, "", 60},
            {std::to_string(file.issues)},
            {upper(common::to_string(file.highest_severity)), getSeverityColor(file.highest_severity)}
        }});
    }
    out << table.render();
}

void ConsoleFormatter::formatRecommendations(const report::Report& report, std::ostream& out) {
    out << colorize("Recommendations", BOLD) << "\n";
    size_t index = 1;
    for (const auto& recommendation : report.summary.recommendations) {
        out << "  " << index++ << ". " << recommendation << "\n";
    }
}

void ConsoleFormatter::formatAnalyzers(const std::vector<analyzer::AnalyzerInfo>& analyzers, std::ostream& out) {
    TableRenderer table(use_colors_);
    table.addRow({{{"Analyzer"}, {"Version"}, {"Description"}, {"Languages"}}, true});
    for (const auto& info : analyzers) {
        table.addRow({{
            {info.id, BOLD},
            {info.version},
            {info.description, "", 60},
            {joinIds(info.supported_languages), "", 50}
        }});
    }
    out << table.render();
}

std::string ConsoleFormatter::colorize(const std::string& text, const std::string& color_code) const {
    if (!use_colors_ || color_code.empty()) return text;
    return color_code + text + RESET;
}

}}
