/**
 * @file test_batch_runner.cpp
 * @brief Directory runs: skip, limit, incremental saves and storage failures
 */

#include <catch2/catch.hpp>

#include "pipeline/batch_runner.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace eps_monitor;

namespace {

class FixedOcr : public OcrEngine {
public:
    std::map<std::string, std::vector<Fragment>> byImage;

    std::vector<Fragment> recognize(const std::vector<uint8_t>&, const std::string& imageName) override {
        auto it = byImage.find(imageName);
        if (it == byImage.end()) throw std::runtime_error("no fragments for " + imageName);
        return it->second;
    }

    std::string name() const override { return "fixed"; }
};

class MemoryTableStore : public TableStore {
public:
    std::map<std::string, CsvTable> tables;
    int saves = 0;
    bool failSaves = false;
    std::string failKey;

    std::optional<CsvTable> load(const std::string& key) override {
        auto it = tables.find(key);
        if (it == tables.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& key, const CsvTable& table) override {
        if (failSaves || key == failKey) throw StorageError("disk full");
        tables[key] = table;
        ++saves;
    }
};

Fragment frag(const std::string& text, double left, double top, double width, double height) {
    Fragment f;
    f.text = text;
    f.left = left;
    f.top = top;
    f.width = width;
    f.height = height;
    return f;
}

std::vector<Fragment> singleBar(const std::string& value) {
    return {frag(value, 40, 50, 20, 10), frag("Q1'14", 35, 150, 30, 12)};
}

class ChartDir {
public:
    ChartDir() : m_path(fs::temp_directory_path() / "eps_monitor_batch_test") {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~ChartDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    void addChart(const std::string& name) {
        cv::Mat img(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));
        cv::rectangle(img, cv::Rect(30, 60, 40, 90), cv::Scalar(0, 0, 0), cv::FILLED);
        REQUIRE(cv::imwrite((m_path / name).string(), img));
    }

    std::string path() const { return m_path.string(); }

private:
    fs::path m_path;
};

} // namespace

TEST_CASE("Weekly charts accumulate into the stored tables", "[batch]") {
    ChartDir dir;
    dir.addChart("20161223-1.png");
    dir.addChart("20161209-1.png");
    dir.addChart("20161216-1.png");
    dir.addChart("20161230-1.png");

    FixedOcr ocr;
    ocr.byImage["20161209-1.png"] = singleBar("1.0");
    ocr.byImage["20161216-1.png"] = singleBar("1.1");
    ocr.byImage["20161223-1.png"] = {};
    // 20161230-1.png has no fragments entry -> OCR failure

    PipelineConfig config;
    MemoryTableStore store;
    ChartExtractor extractor(ocr, config);
    BatchOptions options;
    options.progress = false;
    BatchRunner runner(extractor, store, config, options);

    RunSummary summary = runner.run(dir.path());
    CHECK(summary.processed == 4);
    CHECK(summary.succeeded == 2);
    CHECK(summary.noData == 1);
    CHECK(summary.failed == 1);
    CHECK(summary.newRecords == 2);
    CHECK(summary.totalRows == 2);
    CHECK(store.saves == 4);

    const CsvTable& wide = store.tables.at(config.storage.wideKey);
    CHECK(wide.header == std::vector<std::string>{"Report_Date", "Q1'14"});
    REQUIRE(wide.rows.size() == 2);
    CHECK(wide.rows[0] == std::vector<std::string>{"2016-12-09", "1.0"});
    CHECK(wide.rows[1] == std::vector<std::string>{"2016-12-16", "1.1"});

    const CsvTable& conf = store.tables.at(config.storage.confidenceKey);
    REQUIRE(conf.rows.size() == 2);
    CHECK(conf.rows[0] == std::vector<std::string>{"2016-12-09", "100.0"});
    CHECK(conf.rows[1] == std::vector<std::string>{"2016-12-16", "100.0"});
}

TEST_CASE("Already-processed dates are skipped unless reprocessing", "[batch]") {
    ChartDir dir;
    dir.addChart("20161209-1.png");
    dir.addChart("20161216-1.png");
    dir.addChart("20161223-1.png");

    FixedOcr ocr;
    ocr.byImage["20161209-1.png"] = singleBar("1.0");
    ocr.byImage["20161216-1.png"] = singleBar("1.1");
    ocr.byImage["20161223-1.png"] = singleBar("1.2");

    PipelineConfig config;
    MemoryTableStore store;
    CsvTable existing;
    existing.header = {"Report_Date", "Q1'14", "Confidence"};
    existing.rows = {{"2016-12-09", "0.9", "77.0"}};
    store.tables[config.storage.wideKey] = existing;

    ChartExtractor extractor(ocr, config);

    SECTION("skip and limit") {
        BatchOptions options;
        options.progress = false;
        options.limit = 1;
        BatchRunner runner(extractor, store, config, options);

        auto images = BatchRunner::collectImages(dir.path());
        REQUIRE(images.size() == 3);
        auto selected = runner.selectImages(images, EstimateTable::fromCsv(existing));
        REQUIRE(selected.size() == 1);
        CHECK(fs::path(selected[0]).filename().string() == "20161216-1.png");

        RunSummary summary = runner.run(dir.path());
        CHECK(summary.processed == 1);
        CHECK(summary.totalRows == 2);

        const CsvTable& wide = store.tables.at(config.storage.wideKey);
        CHECK(wide.header == std::vector<std::string>{"Report_Date", "Q1'14"});
        CHECK(wide.rows[0] == std::vector<std::string>{"2016-12-09", "0.9"});
        CHECK(wide.rows[1] == std::vector<std::string>{"2016-12-16", "1.1"});
    }

    SECTION("reprocess") {
        BatchOptions options;
        options.progress = false;
        options.reprocess = true;
        BatchRunner runner(extractor, store, config, options);

        RunSummary summary = runner.run(dir.path());
        CHECK(summary.processed == 3);
        CHECK(summary.totalRows == 3);
        CHECK(runner.wideTable().cell("2016-12-09", QuarterLabel(1, 14)) == "1.0");
    }
}

TEST_CASE("Storage failures stop the run", "[batch]") {
    ChartDir dir;
    dir.addChart("20161209-1.png");
    dir.addChart("20161216-1.png");

    FixedOcr ocr;
    ocr.byImage["20161209-1.png"] = singleBar("1.0");
    ocr.byImage["20161216-1.png"] = singleBar("1.1");

    PipelineConfig config;
    MemoryTableStore store;
    store.failSaves = true;
    ChartExtractor extractor(ocr, config);
    BatchOptions options;
    options.progress = false;
    BatchRunner runner(extractor, store, config, options);

    CHECK_THROWS_AS(runner.run(dir.path()), StorageError);
    CHECK(store.tables.empty());
}

TEST_CASE("A date interrupted by a failed save is processed again", "[batch]") {
    ChartDir dir;
    dir.addChart("20161209-1.png");

    FixedOcr ocr;
    ocr.byImage["20161209-1.png"] = singleBar("1.0");

    PipelineConfig config;
    MemoryTableStore store;
    ChartExtractor extractor(ocr, config);
    BatchOptions options;
    options.progress = false;

    SECTION("confidence table write fails") {
        store.failKey = config.storage.confidenceKey;
        BatchRunner failing(extractor, store, config, options);
        CHECK_THROWS_AS(failing.run(dir.path()), StorageError);
        CHECK(store.tables.count(config.storage.wideKey) == 0);
    }

    SECTION("wide table write fails") {
        store.failKey = config.storage.wideKey;
        BatchRunner failing(extractor, store, config, options);
        CHECK_THROWS_AS(failing.run(dir.path()), StorageError);
        CHECK(store.tables.count(config.storage.wideKey) == 0);
    }

    store.failKey.clear();
    BatchRunner runner(extractor, store, config, options);
    RunSummary summary = runner.run(dir.path());
    CHECK(summary.processed == 1);
    CHECK(summary.succeeded == 1);

    const CsvTable& wide = store.tables.at(config.storage.wideKey);
    REQUIRE(wide.rows.size() == 1);
    CHECK(wide.rows[0] == std::vector<std::string>{"2016-12-09", "1.0"});

    const CsvTable& conf = store.tables.at(config.storage.confidenceKey);
    REQUIRE(conf.rows.size() == 1);
    CHECK(conf.rows[0] == std::vector<std::string>{"2016-12-09", "100.0"});
}

TEST_CASE("Missing image directory is reported", "[batch]") {
    CHECK_THROWS_AS(BatchRunner::collectImages("/nonexistent/eps_charts"), std::runtime_error);
}
