/**
 * @file estimate_table.cpp
 * @brief Wide table pivot/merge and confidence scoring
 */

#include "series/estimate_table.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace eps_monitor {

namespace {

int findColumn(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

bool parseDouble(const std::string& text, double& value) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

double voteScore(const std::optional<BarConfidence>& confidence) {
    if (!confidence) return 0.0;
    switch (*confidence) {
        case BarConfidence::HIGH:   return 100.0;
        case BarConfidence::MEDIUM: return 67.0;
        case BarConfidence::LOW:    return 33.0;
    }
    return 0.0;
}

} // namespace

// ============================================================================
// Formatting
// ============================================================================

std::string formatEps(double eps) {
    char buf[64];
    // Fewest decimals that parse back to the same double
    for (int precision = 0; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*f", precision, eps);
        if (std::strtod(buf, nullptr) == eps) {
            std::string text(buf);
            if (precision == 0) text += ".0";
            return text;
        }
    }
    std::snprintf(buf, sizeof(buf), "%.17g", eps);
    return buf;
}

std::string formatCell(double eps, BarColor color) {
    std::string text = formatEps(eps);
    if (color == BarColor::LIGHT) text += '*';
    return text;
}

std::string formatConfidence(double confidence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", confidence);
    return buf;
}

bool isIsoDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

// ============================================================================
// EstimateTable
// ============================================================================

std::string EstimateTable::cell(const std::string& reportDate, const QuarterLabel& quarter) const {
    auto row = m_rows.find(reportDate);
    if (row == m_rows.end()) return {};
    auto it = row->second.cells.find(quarter);
    return it == row->second.cells.end() ? std::string() : it->second;
}

void EstimateTable::upsertRow(const WideRow& row) {
    WideRow stored;
    stored.reportDate = row.reportDate;
    for (const auto& [quarter, text] : row.cells) {
        m_quarters.insert(quarter);
        if (!text.empty()) stored.cells.emplace(quarter, text);
    }
    m_rows[row.reportDate] = std::move(stored);
}

std::optional<std::string> EstimateTable::firstDate() const {
    if (m_rows.empty()) return std::nullopt;
    return m_rows.begin()->first;
}

std::optional<std::string> EstimateTable::previousDate(const std::string& reportDate) const {
    auto it = m_rows.lower_bound(reportDate);
    if (it == m_rows.begin()) return std::nullopt;
    --it;
    return it->first;
}

CsvTable EstimateTable::toCsv() const {
    CsvTable csv;
    csv.header.reserve(m_quarters.size() + 1);
    csv.header.push_back(kReportDateColumn);
    for (const auto& q : m_quarters) {
        csv.header.push_back(q.text());
    }

    csv.rows.reserve(m_rows.size());
    for (const auto& [date, row] : m_rows) {
        std::vector<std::string> line;
        line.reserve(csv.header.size());
        line.push_back(date);
        for (const auto& q : m_quarters) {
            auto it = row.cells.find(q);
            line.push_back(it == row.cells.end() ? std::string() : it->second);
        }
        csv.rows.push_back(std::move(line));
    }
    return csv;
}

EstimateTable EstimateTable::fromCsv(const CsvTable& csv) {
    EstimateTable table;
    if (csv.header.empty()) return table;

    const int dateCol = findColumn(csv.header, kReportDateColumn);
    if (dateCol < 0) {
        throw StorageError("Wide table has no " + std::string(kReportDateColumn) + " column");
    }

    std::vector<std::pair<size_t, QuarterLabel>> quarterCols;
    for (size_t i = 0; i < csv.header.size(); ++i) {
        if (static_cast<int>(i) == dateCol) continue;
        const std::string& name = csv.header[i];
        if (name == kConfidenceColumn) {
            logDebug("Dropping legacy Confidence column from wide table");
            continue;
        }
        auto q = QuarterLabel::fromText(name);
        if (!q) {
            logWarning("Ignoring non-quarter column in wide table: " + name);
            continue;
        }
        quarterCols.emplace_back(i, *q);
        table.m_quarters.insert(*q);
    }

    for (size_t r = 0; r < csv.rows.size(); ++r) {
        const auto& line = csv.rows[r];
        if (static_cast<size_t>(dateCol) >= line.size() || !isIsoDate(line[dateCol])) {
            throw StorageError("Malformed report date in wide table row " + std::to_string(r + 1));
        }

        WideRow row;
        row.reportDate = line[dateCol];
        for (const auto& [col, q] : quarterCols) {
            if (col < line.size() && !line[col].empty()) {
                row.cells.emplace(q, line[col]);
            }
        }
        table.upsertRow(row);
    }
    return table;
}

// ============================================================================
// ConfidenceTable
// ============================================================================

std::optional<double> ConfidenceTable::get(const std::string& reportDate) const {
    auto it = m_values.find(reportDate);
    if (it == m_values.end()) return std::nullopt;
    return it->second;
}

CsvTable ConfidenceTable::toCsv() const {
    CsvTable csv;
    csv.header = {kReportDateColumn, kConfidenceColumn};
    csv.rows.reserve(m_values.size());
    for (const auto& [date, value] : m_values) {
        csv.rows.push_back({date, formatConfidence(value)});
    }
    return csv;
}

ConfidenceTable ConfidenceTable::fromCsv(const CsvTable& csv) {
    ConfidenceTable table;
    if (csv.header.empty()) return table;

    const int dateCol = findColumn(csv.header, kReportDateColumn);
    const int confCol = findColumn(csv.header, kConfidenceColumn);
    if (dateCol < 0 || confCol < 0) {
        throw StorageError("Confidence table needs Report_Date and Confidence columns");
    }

    for (size_t r = 0; r < csv.rows.size(); ++r) {
        const auto& line = csv.rows[r];
        const size_t needed = static_cast<size_t>(std::max(dateCol, confCol));
        if (needed >= line.size() || !isIsoDate(line[dateCol])) {
            throw StorageError("Malformed confidence table row " + std::to_string(r + 1));
        }
        double value = 0.0;
        if (!parseDouble(line[confCol], value)) {
            throw StorageError("Non-numeric confidence in row " + std::to_string(r + 1) +
                               ": " + line[confCol]);
        }
        table.upsert(line[dateCol], value);
    }
    return table;
}

// ============================================================================
// Pivot / merge
// ============================================================================

EstimateTable toWideTable(const std::vector<ExtractionRecord>& records) {
    std::map<std::string, WideRow> rows;
    for (const auto& rec : records) {
        WideRow& row = rows[rec.reportDate];
        row.reportDate = rec.reportDate;
        // emplace keeps the first value for a repeated quarter
        row.cells.emplace(rec.quarter, formatCell(rec.eps, rec.barColor));
    }

    EstimateTable table;
    for (const auto& [date, row] : rows) {
        table.upsertRow(row);
    }
    return table;
}

void mergeTables(EstimateTable& base, const EstimateTable& update) {
    for (const auto& q : update.quarters()) {
        base.addQuarter(q);
    }
    for (const auto& [date, row] : update.rows()) {
        base.upsertRow(row);
    }
}

void mergeConfidence(ConfidenceTable& base, const ConfidenceTable& update) {
    for (const auto& [date, value] : update.values()) {
        base.upsert(date, value);
    }
}

// ============================================================================
// ConfidenceEngine
// ============================================================================

ConfidenceEngine::ConfidenceEngine(const ConfidenceConfig& config)
    : m_config(config) {}

double ConfidenceEngine::barScore(const std::vector<ExtractionRecord>& dateRecords) const {
    if (dateRecords.empty()) return 0.0;

    double sum = 0.0;
    for (const auto& rec : dateRecords) {
        sum += voteScore(rec.barConfidence);
    }
    return sum / static_cast<double>(dateRecords.size());
}

double ConfidenceEngine::consistencyScore(const std::string& reportDate,
                                          const std::vector<ExtractionRecord>& dateRecords,
                                          const EstimateTable& table) const {
    auto first = table.firstDate();
    if (first && *first == reportDate) return 100.0;

    auto prev = table.previousDate(reportDate);
    if (!prev) return 0.0;

    std::set<QuarterLabel> actualQuarters;
    for (const auto& rec : dateRecords) {
        if (rec.barColor == BarColor::DARK) actualQuarters.insert(rec.quarter);
    }
    if (actualQuarters.empty()) return 0.0;

    int total = 0;
    int matches = 0;
    for (const auto& q : actualQuarters) {
        if (!table.quarters().count(q)) continue;

        const std::string current = table.cell(reportDate, q);
        const std::string previous = table.cell(*prev, q);
        if (current.empty() || previous.empty()) continue;
        if (current.find('*') != std::string::npos || previous.find('*') != std::string::npos) continue;

        double c = 0.0;
        double p = 0.0;
        if (!parseDouble(current, c) || !parseDouble(previous, p)) continue;

        ++total;
        const double relative = std::abs(c - p) / std::max(std::abs(p), 0.01);
        if (relative <= m_config.consistencyTolerance) ++matches;
    }

    return total > 0 ? 100.0 * matches / total : 0.0;
}

ConfidenceTable ConfidenceEngine::compute(const std::vector<ExtractionRecord>& newRecords,
                                          const EstimateTable& mergedTable) const {
    std::map<std::string, std::vector<ExtractionRecord>> byDate;
    for (const auto& rec : newRecords) {
        byDate[rec.reportDate].push_back(rec);
    }

    ConfidenceTable out;
    for (const auto& [date, records] : byDate) {
        if (!mergedTable.hasDate(date)) continue;

        const double bar = barScore(records);
        const double consistency = consistencyScore(date, records, mergedTable);
        const double blended = m_config.barWeight * bar + (1.0 - m_config.barWeight) * consistency;
        // Half-to-even at one decimal: 79.25 -> 79.2
        const double rounded = std::nearbyint(blended * 10.0) / 10.0;

        logDebug(date + " confidence: bar=" + formatConfidence(bar) +
                 " consistency=" + formatConfidence(consistency) +
                 " -> " + formatConfidence(rounded));
        out.upsert(date, rounded);
    }
    return out;
}

MergeResult mergeRecords(const EstimateTable& existingWide,
                         const ConfidenceTable& existingConfidence,
                         const std::vector<ExtractionRecord>& newRecords,
                         const ConfidenceConfig& config) {
    MergeResult result{existingWide, existingConfidence};
    if (newRecords.empty()) return result;

    mergeTables(result.wide, toWideTable(newRecords));

    ConfidenceEngine engine(config);
    mergeConfidence(result.confidence, engine.compute(newRecords, result.wide));
    return result;
}

} // namespace eps_monitor
