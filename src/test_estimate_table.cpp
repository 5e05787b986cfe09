/**
 * @file test_estimate_table.cpp
 * @brief Pivot, last-write-wins merge and confidence scoring
 */

#include <catch2/catch.hpp>

#include "series/estimate_table.h"

using namespace eps_monitor;

namespace {

ExtractionRecord record(const std::string& date, int quarter, int yy, double eps,
                        BarColor color, std::optional<BarConfidence> confidence = BarConfidence::HIGH) {
    return ExtractionRecord{date, QuarterLabel(quarter, yy), eps, color, confidence,
                            color == BarColor::LIGHT};
}

} // namespace

TEST_CASE("EPS text uses the shortest exact decimal", "[series]") {
    CHECK(formatEps(28.0) == "28.0");
    CHECK(formatEps(27.85) == "27.85");
    CHECK(formatEps(1.1) == "1.1");
    CHECK(formatEps(0.0) == "0.0");
    CHECK(formatEps(-0.5) == "-0.5");
    CHECK(formatEps(123.456) == "123.456");

    CHECK(formatCell(28.0, BarColor::DARK) == "28.0");
    CHECK(formatCell(28.1, BarColor::LIGHT) == "28.1*");

    CHECK(formatConfidence(100.0) == "100.0");
    CHECK(formatConfidence(33.5) == "33.5");
}

TEST_CASE("Pivot keeps the first record of a colliding cell", "[series]") {
    const std::vector<ExtractionRecord> records = {
        record("2017-03-03", 1, 17, 1.2, BarColor::DARK),
        record("2017-03-03", 2, 17, 1.4, BarColor::LIGHT),
        record("2017-03-03", 1, 17, 9.9, BarColor::DARK),
    };

    auto table = toWideTable(records);
    REQUIRE(table.size() == 1);
    CHECK(table.cell("2017-03-03", QuarterLabel(1, 17)) == "1.2");
    CHECK(table.cell("2017-03-03", QuarterLabel(2, 17)) == "1.4*");
    CHECK(table.cell("2017-03-03", QuarterLabel(3, 17)).empty());
    CHECK(table.cell("2017-03-10", QuarterLabel(1, 17)).empty());
}

TEST_CASE("Merge replaces the whole row for a repeated report date", "[series]") {
    EstimateTable base = toWideTable({
        record("2016-12-09", 1, 14, 1.0, BarColor::DARK),
        record("2016-12-09", 2, 14, 2.0, BarColor::LIGHT),
        record("2016-12-16", 1, 14, 1.1, BarColor::DARK),
    });

    mergeTables(base, toWideTable({record("2016-12-09", 1, 14, 1.2, BarColor::DARK)}));

    CHECK(base.size() == 2);
    CHECK(base.cell("2016-12-09", QuarterLabel(1, 14)) == "1.2");
    CHECK(base.cell("2016-12-09", QuarterLabel(2, 14)).empty());
    CHECK(base.quarters().count(QuarterLabel(2, 14)) == 1);
    CHECK(base.cell("2016-12-16", QuarterLabel(1, 14)) == "1.1");
}

TEST_CASE("Second value for the same date and quarter wins across merges", "[series]") {
    auto first = mergeRecords(EstimateTable(), ConfidenceTable(),
                              {record("2017-03-03", 1, 17, 1.2, BarColor::DARK)});
    auto second = mergeRecords(first.wide, first.confidence,
                               {record("2017-03-03", 1, 17, 1.3, BarColor::DARK)});

    REQUIRE(second.wide.size() == 1);
    CHECK(second.wide.cell("2017-03-03", QuarterLabel(1, 17)) == "1.3");
    CHECK(second.confidence.size() == 1);
}

TEST_CASE("Rows sort by date and columns by year then quarter", "[series]") {
    auto table = toWideTable({
        record("2017-01-06", 1, 17, 1.0, BarColor::LIGHT),
        record("2016-12-30", 4, 16, 0.9, BarColor::DARK),
        record("2016-12-30", 1, 17, 1.0, BarColor::LIGHT),
    });

    CsvTable csv = table.toCsv();
    REQUIRE(csv.header == std::vector<std::string>{"Report_Date", "Q4'16", "Q1'17"});
    REQUIRE(csv.rows.size() == 2);
    CHECK(csv.rows[0] == std::vector<std::string>{"2016-12-30", "0.9", "1.0*"});
    CHECK(csv.rows[1] == std::vector<std::string>{"2017-01-06", "", "1.0*"});
}

TEST_CASE("Bar score averages vote confidence", "[confidence]") {
    ConfidenceEngine engine;

    CHECK(engine.barScore({}) == 0.0);
    CHECK(engine.barScore({record("d", 1, 17, 1, BarColor::DARK, BarConfidence::HIGH)}) == 100.0);
    CHECK(engine.barScore({record("d", 1, 17, 1, BarColor::DARK, BarConfidence::HIGH),
                           record("d", 2, 17, 1, BarColor::DARK, BarConfidence::MEDIUM),
                           record("d", 3, 17, 1, BarColor::DARK, BarConfidence::LOW),
                           record("d", 4, 17, 1, BarColor::DARK, std::nullopt)}) ==
          Approx((100.0 + 67.0 + 33.0 + 0.0) / 4.0));
}

TEST_CASE("First report date is fully consistent regardless of bar votes", "[confidence]") {
    auto merged = mergeRecords(EstimateTable(), ConfidenceTable(),
                               {record("2016-12-09", 1, 14, 1.0, BarColor::DARK, std::nullopt)});

    auto value = merged.confidence.get("2016-12-09");
    REQUIRE(value);
    CHECK(*value == Approx(50.0));

    ConfidenceEngine engine;
    CHECK(engine.consistencyScore("2016-12-09", {}, merged.wide) == 100.0);
}

TEST_CASE("Three weekly reports score against the prior week only", "[confidence]") {
    EstimateTable wide;
    ConfidenceTable confidence;

    const std::vector<std::vector<ExtractionRecord>> weeks = {
        {record("2016-12-09", 1, 14, 1.0, BarColor::DARK)},
        {record("2016-12-16", 1, 14, 1.1, BarColor::DARK)},
        {record("2016-12-23", 1, 14, 1.5, BarColor::DARK, BarConfidence::MEDIUM)},
    };
    for (const auto& week : weeks) {
        auto merged = mergeRecords(wide, confidence, week);
        wide = merged.wide;
        confidence = merged.confidence;
    }

    CsvTable csv = wide.toCsv();
    REQUIRE(csv.rows.size() == 3);
    CHECK(csv.rows[0][0] == "2016-12-09");
    CHECK(csv.rows[1][0] == "2016-12-16");
    CHECK(csv.rows[2][0] == "2016-12-23");

    // first date: bar 100, consistency 100
    CHECK(*confidence.get("2016-12-09") == Approx(100.0));
    // 1.0 -> 1.1 is within 20%
    CHECK(*confidence.get("2016-12-16") == Approx(100.0));
    // 1.1 -> 1.5 is not; bar 67 -> (67 + 0) / 2
    CHECK(*confidence.get("2016-12-23") == Approx(33.5));

    CsvTable confCsv = confidence.toCsv();
    REQUIRE(confCsv.rows.size() == 3);
    CHECK(confCsv.rows[2] == std::vector<std::string>{"2016-12-23", "33.5"});
}

TEST_CASE("Confidence ties round to the even tenth", "[confidence]") {
    EstimateTable wide;
    ConfidenceTable confidence;

    std::vector<ExtractionRecord> previous;
    for (int q = 1; q <= 4; ++q) {
        previous.push_back(record("2016-12-09", q, 15, 1.0, BarColor::DARK));
    }
    auto merged = mergeRecords(wide, confidence, previous);

    const std::vector<ExtractionRecord> current = {
        record("2016-12-16", 1, 15, 1.0, BarColor::DARK, BarConfidence::HIGH),
        record("2016-12-16", 2, 15, 1.0, BarColor::DARK, BarConfidence::HIGH),
        record("2016-12-16", 3, 15, 1.0, BarColor::DARK, BarConfidence::MEDIUM),
        record("2016-12-16", 4, 15, 5.0, BarColor::DARK, BarConfidence::MEDIUM),
    };
    merged = mergeRecords(merged.wide, merged.confidence, current);

    // bar 83.5, consistency 75 -> 79.25
    auto value = merged.confidence.get("2016-12-16");
    REQUIRE(value);
    CHECK(*value == 79.2);
    CHECK(merged.confidence.toCsv().rows[1] == std::vector<std::string>{"2016-12-16", "79.2"});
}

TEST_CASE("Consistency skips estimates and missing cells", "[confidence]") {
    ConfidenceEngine engine;
    EstimateTable wide = toWideTable({
        record("2017-01-06", 1, 16, 1.00, BarColor::DARK),
        record("2017-01-06", 2, 16, 2.00, BarColor::LIGHT),
        record("2017-01-13", 1, 16, 1.05, BarColor::DARK),
        record("2017-01-13", 2, 16, 2.00, BarColor::DARK),
        record("2017-01-13", 3, 16, 3.00, BarColor::DARK),
    });
    const std::vector<ExtractionRecord> current = {
        record("2017-01-13", 1, 16, 1.05, BarColor::DARK),
        record("2017-01-13", 2, 16, 2.00, BarColor::DARK),
        record("2017-01-13", 3, 16, 3.00, BarColor::DARK),
    };

    // Q2 previous is an estimate, Q3 has no previous value: only Q1 compares
    CHECK(engine.consistencyScore("2017-01-13", current, wide) == Approx(100.0));

    // No dark bars at all
    CHECK(engine.consistencyScore("2017-01-13",
                                  {record("2017-01-13", 1, 16, 1.05, BarColor::LIGHT)}, wide) == 0.0);
}

TEST_CASE("Consistency compares against a zero previous value safely", "[confidence]") {
    ConfidenceEngine engine;
    EstimateTable wide = toWideTable({
        record("2017-01-06", 1, 16, 0.0, BarColor::DARK),
        record("2017-01-13", 1, 16, 0.001, BarColor::DARK),
        record("2017-01-20", 1, 16, 0.5, BarColor::DARK),
    });

    CHECK(engine.consistencyScore("2017-01-13", {record("2017-01-13", 1, 16, 0.001, BarColor::DARK)}, wide) ==
          Approx(100.0));
    CHECK(engine.consistencyScore("2017-01-20", {record("2017-01-20", 1, 16, 0.5, BarColor::DARK)}, wide) ==
          Approx(0.0));
}

TEST_CASE("Loading a legacy wide table drops the Confidence column", "[series]") {
    CsvTable csv;
    csv.header = {"Report_Date", "Q1'14", "Notes", "Confidence", "Q2'14"};
    csv.rows = {
        {"2016-12-09", "1.0", "x", "88.0", "2.0*"},
        {"2016-12-16", "1.1", "", "90.0", ""},
    };

    auto table = EstimateTable::fromCsv(csv);
    CHECK(table.size() == 2);
    CHECK(table.quarters().size() == 2);
    CHECK(table.cell("2016-12-09", QuarterLabel(2, 14)) == "2.0*");

    CsvTable out = table.toCsv();
    CHECK(out.header == std::vector<std::string>{"Report_Date", "Q1'14", "Q2'14"});
    CHECK(out.rows[1] == std::vector<std::string>{"2016-12-16", "1.1", ""});
}

TEST_CASE("Malformed stored tables are storage errors", "[series]") {
    CsvTable noDate;
    noDate.header = {"Date", "Q1'14"};
    CHECK_THROWS_AS(EstimateTable::fromCsv(noDate), StorageError);

    CsvTable badDate;
    badDate.header = {"Report_Date", "Q1'14"};
    badDate.rows = {{"20161209", "1.0"}};
    CHECK_THROWS_AS(EstimateTable::fromCsv(badDate), StorageError);

    CsvTable badConfidence;
    badConfidence.header = {"Report_Date", "Confidence"};
    badConfidence.rows = {{"2016-12-09", "high"}};
    CHECK_THROWS_AS(ConfidenceTable::fromCsv(badConfidence), StorageError);

    CHECK(EstimateTable::fromCsv(CsvTable{}).empty());
}

TEST_CASE("Merging no records leaves both tables unchanged", "[series]") {
    auto existing = mergeRecords(EstimateTable(), ConfidenceTable(),
                                 {record("2016-12-09", 1, 14, 1.0, BarColor::DARK)});
    auto merged = mergeRecords(existing.wide, existing.confidence, {});

    CHECK(merged.wide.toCsv().rows == existing.wide.toCsv().rows);
    CHECK(merged.confidence.toCsv().rows == existing.confidence.toCsv().rows);
}
