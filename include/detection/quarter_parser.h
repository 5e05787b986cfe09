#pragma once
/**
 * @file quarter_parser.h
 * @brief Quarter label and number parsing for chart OCR fragments
 */

#include "types.h"
#include <optional>
#include <string>

namespace eps_monitor {

/**
 * @brief Parser for quarter labels, EPS numbers and report dates
 */
class QuarterParser {
public:
    QuarterParser() = default;

    /**
     * @brief Apply targeted OCR corrections before pattern matching
     *
     * - Leading O/0 followed by 1-4 becomes Q (Q read as zero or letter O)
     * - Q followed by I/l and a digit gets the 1 restored
     *
     * @param text Raw fragment text
     * @return Normalized text
     */
    std::string normalize(const std::string& text) const;

    /**
     * @brief Extract a canonical quarter label from OCR text
     *
     * Patterns are tried in priority order, first match wins:
     * 1. Q1'17
     * 2. Q1 2017
     * 3. Q117 (year guarded to 14-99 or 00-25)
     * 4. 0117 / O117 (same guard)
     * 5. Q1i7y (apostrophe read as i/I/l, trailing y/i)
     *
     * @param text Raw fragment text
     * @return Quarter label or nullopt when the text is not a quarter
     */
    std::optional<QuarterLabel> extractQuarter(const std::string& text) const;

    /**
     * @brief Extract the first number from OCR text
     *
     * Thousands separators and minus signs are stripped first.
     *
     * @param text Raw fragment text
     * @return Parsed value or nullopt
     */
    std::optional<double> extractNumber(const std::string& text) const;

    /**
     * @brief Derive the report date from an embedded YYYYMMDD token
     *
     * @param filename Image filename (e.g. "20161209-6.png")
     * @return ISO date, or the raw filename flagged invalid
     */
    ReportDate reportDateFromFilename(const std::string& filename) const;

    /**
     * @brief Return the first 8-digit token of a filename, if any
     */
    std::optional<std::string> dateToken(const std::string& filename) const;

private:
    static bool plausibleYear(int yy);
};

} // namespace eps_monitor
