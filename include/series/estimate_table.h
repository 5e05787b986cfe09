#pragma once
/**
 * @file estimate_table.h
 * @brief Wide EPS time series and its per-date confidence
 *
 * Wide table: one row per report date (ascending), one column per quarter
 * (chronological). A cell is empty, "27.85" (actual, dark bar) or
 * "28.1*" (estimate, light bar).
 */

#include "types.h"
#include "storage/table_store.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace eps_monitor {

constexpr const char* kReportDateColumn = "Report_Date";
constexpr const char* kConfidenceColumn = "Confidence";

struct WideRow {
    std::string reportDate;                         ///< YYYY-MM-DD
    std::map<QuarterLabel, std::string> cells;      ///< Absent quarter = empty cell
};

class EstimateTable {
public:
    const std::set<QuarterLabel>& quarters() const { return m_quarters; }
    const std::map<std::string, WideRow>& rows() const { return m_rows; }

    size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }
    bool hasDate(const std::string& reportDate) const { return m_rows.count(reportDate) > 0; }

    /**
     * @brief Cell text, empty string when the date or quarter is absent
     */
    std::string cell(const std::string& reportDate, const QuarterLabel& quarter) const;

    /**
     * @brief Insert a row or replace the existing row for its date entirely
     */
    void upsertRow(const WideRow& row);

    void addQuarter(const QuarterLabel& quarter) { m_quarters.insert(quarter); }

    std::optional<std::string> firstDate() const;

    /**
     * @brief Latest report date strictly before the given one
     */
    std::optional<std::string> previousDate(const std::string& reportDate) const;

    CsvTable toCsv() const;

    /**
     * @throws StorageError on a missing Report_Date column or malformed date
     */
    static EstimateTable fromCsv(const CsvTable& csv);

private:
    std::set<QuarterLabel> m_quarters;
    std::map<std::string, WideRow> m_rows;
};

class ConfidenceTable {
public:
    const std::map<std::string, double>& values() const { return m_values; }
    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    std::optional<double> get(const std::string& reportDate) const;
    void upsert(const std::string& reportDate, double confidence) { m_values[reportDate] = confidence; }

    CsvTable toCsv() const;

    /**
     * @throws StorageError on missing columns or non-numeric confidence
     */
    static ConfidenceTable fromCsv(const CsvTable& csv);

private:
    std::map<std::string, double> m_values;
};

/**
 * @brief Python-style shortest round-trip text ("27.85", "28.0")
 */
std::string formatEps(double eps);

/**
 * @brief Cell text for a record, "*" suffix for light (estimate) bars
 */
std::string formatCell(double eps, BarColor color);

/**
 * @brief One decimal place
 */
std::string formatConfidence(double confidence);

/**
 * @brief True for a YYYY-MM-DD string
 */
bool isIsoDate(const std::string& text);

/**
 * @brief Pivot long records into wide rows
 *
 * When two records share (report date, quarter) the first one wins.
 */
EstimateTable toWideTable(const std::vector<ExtractionRecord>& records);

/**
 * @brief Fold update rows into base; an update row replaces the base row for its date
 */
void mergeTables(EstimateTable& base, const EstimateTable& update);

/**
 * @brief Same last-write-wins rule for confidence values
 */
void mergeConfidence(ConfidenceTable& base, const ConfidenceTable& update);

/**
 * @brief Composite confidence: bar-vote agreement blended with week-over-week stability of actuals
 */
class ConfidenceEngine {
public:
    explicit ConfidenceEngine(const ConfidenceConfig& config = ConfidenceConfig{});

    /**
     * @brief Mean of high=100, medium=67, low=33, missing=0 (0 with no records)
     */
    double barScore(const std::vector<ExtractionRecord>& dateRecords) const;

    /**
     * @brief Share of dark-bar quarters whose value stayed within tolerance of the previous report date
     *
     * 100 for the first date in the table, 0 when nothing is comparable.
     */
    double consistencyScore(const std::string& reportDate,
                            const std::vector<ExtractionRecord>& dateRecords,
                            const EstimateTable& table) const;

    /**
     * @brief Confidence for every report date in the new records
     * @param newRecords Records of this merge
     * @param mergedTable Wide table after the merge
     */
    ConfidenceTable compute(const std::vector<ExtractionRecord>& newRecords,
                            const EstimateTable& mergedTable) const;

private:
    ConfidenceConfig m_config;
};

struct MergeResult {
    EstimateTable wide;
    ConfidenceTable confidence;
};

/**
 * @brief Pivot, merge and score one batch of new records
 */
MergeResult mergeRecords(const EstimateTable& existingWide,
                         const ConfidenceTable& existingConfidence,
                         const std::vector<ExtractionRecord>& newRecords,
                         const ConfidenceConfig& config = ConfidenceConfig{});

} // namespace eps_monitor
