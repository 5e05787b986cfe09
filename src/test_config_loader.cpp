/**
 * @file test_config_loader.cpp
 * @brief Pipeline configuration JSON
 */

#include <catch2/catch.hpp>

#include "utils/config_loader.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace eps_monitor;

TEST_CASE("Partial config overrides only the given fields", "[config]") {
    PipelineConfig config;
    std::string err;
    REQUIRE(parsePipelineConfig(R"({
        "matcher": { "x_tolerance": 14 },
        "confidence": { "bar_weight": 0.6 },
        "ocr": { "backend": "tesseract", "language": "deu" },
        "log_level": "debug"
    })", config, err));
    CHECK(err.empty());

    CHECK(config.matcher.xTolerance == Approx(14.0));
    CHECK(config.matcher.yTolerance == Approx(1000.0));
    CHECK(config.matcher.bottomPercent == Approx(0.3));
    CHECK(config.confidence.barWeight == Approx(0.6));
    CHECK(config.confidence.consistencyTolerance == Approx(0.2));
    CHECK(config.barClassifier.regionWidth == 30);
    CHECK(config.ocr.backend == "tesseract");
    CHECK(config.ocr.language == "deu");
    CHECK(config.ocr.fragmentsDir == "output/ocr");
    CHECK(config.storage.wideKey == "extracted_estimates.csv");
    CHECK(config.logLevel == "debug");
}

TEST_CASE("Malformed config is rejected", "[config]") {
    PipelineConfig config;
    config.logLevel = "warning";
    std::string err;

    CHECK_FALSE(parsePipelineConfig("{ not json", config, err));
    CHECK_FALSE(err.empty());
    CHECK(config.logLevel == "warning");

    CHECK_FALSE(parsePipelineConfig("[1, 2]", config, err));
    CHECK_FALSE(parsePipelineConfig(R"({"matcher": {"x_tolerance": "wide"}})", config, err));
}

TEST_CASE("Missing config file falls back to defaults", "[config]") {
    PipelineConfig config = loadPipelineConfig("/nonexistent/pipeline_config.json");
    CHECK(config.matcher.xTolerance == Approx(10.0));
    CHECK(config.barClassifier.adaptiveBlockSize == 11);
    CHECK(config.storage.root == "output");
}

TEST_CASE("Config fallback reason is returned to the caller", "[config]") {
    const fs::path dir = fs::temp_directory_path() / "eps_monitor_config_warning_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string path = (dir / "pipeline_config.json").string();

    std::string warning;
    PipelineConfig config = loadPipelineConfig(path, warning);
    CHECK(warning.find("Cannot open config file") != std::string::npos);
    CHECK(config.logLevel == "info");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    loadPipelineConfig(path, warning);
    CHECK(warning.find(path) == 0);

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"log_level": "error"})";
    }
    config = loadPipelineConfig(path, warning);
    CHECK(warning.empty());
    CHECK(config.logLevel == "error");

    fs::remove_all(dir);
}

TEST_CASE("Saved config loads back", "[config]") {
    const fs::path dir = fs::temp_directory_path() / "eps_monitor_config_test";
    fs::remove_all(dir);
    const std::string path = (dir / "pipeline_config.json").string();

    PipelineConfig config;
    config.matcher.xTolerance = 12.5;
    config.barClassifier.closingKernel = 5;
    config.storage.root = "data";

    std::string err;
    REQUIRE(savePipelineConfig(path, config, err));

    PipelineConfig loaded = loadPipelineConfig(path);
    CHECK(loaded.matcher.xTolerance == Approx(12.5));
    CHECK(loaded.barClassifier.closingKernel == 5);
    CHECK(loaded.storage.root == "data");

    fs::remove_all(dir);
}
