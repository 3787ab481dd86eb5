#pragma once

#include "../report/report.hpp"
#include "../analyzer/analyzer.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace code_sentinel {
namespace format {

struct TableCell {
    std::string content;
    std::string fg_color;
    // Longer content is cut with "..."; 0 means unlimited.
    int max_width = 0;
};

struct TableRow {
    std::vector<TableCell> cells;
    bool is_header = false;
};

class TableRenderer {
public:
    explicit TableRenderer(bool use_colors);

    void addRow(const TableRow& row);
    std::string render();

private:
    bool use_colors_;
    std::vector<TableRow> rows_;
    std::vector<int> column_widths_;

    void calculateColumnWidths();
    std::string renderBorder(const std::string& left, const std::string& middle, const std::string& right) const;
    std::string fitCell(const TableCell& cell) const;
    std::string colorize(const std::string& text, const std::string& color_code) const;

    static int getDisplayWidth(const std::string& text);
};

class ConsoleFormatter {
public:
    explicit ConsoleFormatter(bool use_colors = true, size_t max_issues = 50);

    void format(const report::Report& report, std::ostream& out);
    void formatAnalyzers(const std::vector<analyzer::AnalyzerInfo>& analyzers, std::ostream& out);

    static std::string getSeverityColor(common::Severity severity);
    static std::string getGradeColor(const std::string& grade);

private:
    bool use_colors_;
    size_t max_issues_;

    void formatOverview(const report::Report& report, std::ostream& out);
    void formatSeverityTable(const report::Report& report, std::ostream& out);
    void formatAnalyzerTable(const report::Report& report, std::ostream& out);
    void formatIssues(const report::Report& report, std::ostream& out);
    void formatTopFiles(const report::Report& report, std::ostream& out);
    void formatRecommendations(const report::Report& report, std::ostream& out);

    std::string colorize(const std::string& text, const std::string& color_code) const;
};

}}
