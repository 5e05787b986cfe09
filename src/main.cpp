/**
 * @file main.cpp
 * @brief EPS Chart Monitor - Main entry point
 *
 * Reads quarterly EPS bar charts, pairs quarter labels with EPS values,
 * tells actuals (dark bars) from estimates (light bars) and folds the
 * results into a wide time series with per-date confidence.
 */

// Pipeline:
// image -> OCR fragments -> quarter/number matching -> bar fill votes -> records -> wide table + confidence

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "ocr/ocr_engine.h"
#include "pipeline/batch_runner.h"
#include "pipeline/chart_extractor.h"
#include "storage/csv_table_store.h"
#include "utils/config_loader.h"
#include "utils/logger.h"

using namespace eps_monitor;

namespace {

void printBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║         EPS Chart Monitor v1.0                                ║
║         Quarter labels + bar fill -> EPS time series          ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Path to config file (default: config/pipeline_config.json)\n"
              << "  --images <dir>     Process every *.png chart in a directory (default: output/charts)\n"
              << "  --image <path>     Process a single chart and print diagnostics (tables untouched)\n"
              << "  --limit <n>        Process at most N images (0 = all)\n"
              << "  --reprocess        Also process report dates already in the table\n"
              << "  --ocr <backend>    OCR backend: json | tesseract (default from config)\n"
              << "  --fragments <dir>  Directory of cached OCR JSON files (json backend)\n"
              << "  --output <dir>     Table storage directory (default from config)\n"
              << "  --json-output <path>  With --image: write diagnostics as JSON\n"
              << "  --x-tolerance <px> Max horizontal distance between quarter and number (default: 10)\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

nlohmann::json extractionToJson(const ImageExtraction& result) {
    nlohmann::json j;
    j["image"] = result.imageName;
    j["report_date"] = result.reportDate.valid ? result.reportDate.iso : std::string();
    j["fragments"] = result.fragmentCount;
    if (result.failed()) j["error"] = result.error;

    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& p : result.pairs) {
        nlohmann::json jp;
        jp["quarter"] = p.quarter.text();
        jp["eps"] = p.eps;
        jp["distance"] = p.distance;
        jp["quarter_box"] = {p.quarterBox.left, p.quarterBox.top, p.quarterBox.width, p.quarterBox.height};
        jp["number_box"] = {p.numberBox.left, p.numberBox.top, p.numberBox.width, p.numberBox.height};
        if (p.bar) {
            jp["bar_color"] = toString(p.bar->color);
            jp["bar_confidence"] = toString(p.bar->confidence);
            jp["dark_votes"] = p.bar->darkVotes;
            jp["light_votes"] = p.bar->lightVotes;
            nlohmann::json methods = nlohmann::json::object();
            for (const auto& [name, color] : p.bar->methods) {
                methods[name] = toString(color);
            }
            jp["methods"] = methods;
        }
        pairs.push_back(jp);
    }
    j["pairs"] = pairs;

    j["timing_ms"] = {
        {"ocr", result.stats.ocrMs},
        {"match", result.stats.matchMs},
        {"decode", result.stats.decodeMs},
        {"classify", result.stats.classifyMs},
        {"total", result.stats.totalMs},
    };
    return j;
}

void printExtraction(const ImageExtraction& result) {
    std::cout << result.imageName << ": " << result.fragmentCount << " fragments, "
              << result.pairs.size() << " pairs";
    if (result.reportDate.valid) std::cout << ", report date " << result.reportDate.iso;
    std::cout << "\n";

    if (result.failed()) {
        std::cout << "  ERROR: " << result.error << "\n";
    }

    std::cout << std::fixed << std::setprecision(1);
    for (const auto& p : result.pairs) {
        std::cout << "  " << std::left << std::setw(7) << p.quarter.text() << std::right
                  << std::setw(8) << p.eps
                  << "  dist=" << std::setw(6) << p.distance;
        if (p.bar) {
            std::cout << "  " << std::setw(5) << toString(p.bar->color)
                      << " (" << toString(p.bar->confidence) << ", "
                      << p.bar->darkVotes << "D/" << p.bar->lightVotes << "L)";
            for (const auto& [name, color] : p.bar->methods) {
                std::cout << " " << name << "=" << toString(color);
            }
        }
        std::cout << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);

    std::cout << "Timing: ocr " << result.stats.ocrMs << " ms, match " << result.stats.matchMs
              << " ms, classify " << result.stats.classifyMs << " ms, total "
              << result.stats.totalMs << " ms" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    // Parse command line arguments
    std::string configPath = "config/pipeline_config.json";
    std::string imagesDir = "output/charts";
    std::string singleImage;
    std::string jsonOutputPath;
    std::string ocrBackend;
    std::string fragmentsDir;
    std::string outputDir;
    double xTolerance = -1.0;
    BatchOptions options;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--images" && i + 1 < argc) {
                imagesDir = argv[++i];
            } else if (arg == "--image" && i + 1 < argc) {
                singleImage = argv[++i];
            } else if (arg == "--limit" && i + 1 < argc) {
                options.limit = static_cast<size_t>((std::max)(0, std::stoi(argv[++i])));
            } else if (arg == "--reprocess") {
                options.reprocess = true;
            } else if (arg == "--ocr" && i + 1 < argc) {
                ocrBackend = argv[++i];
            } else if (arg == "--fragments" && i + 1 < argc) {
                fragmentsDir = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                outputDir = argv[++i];
            } else if (arg == "--json-output" && i + 1 < argc) {
                jsonOutputPath = argv[++i];
            } else if (arg == "--x-tolerance" && i + 1 < argc) {
                xTolerance = std::stod(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else {
                std::cerr << "ERROR: Unknown or incomplete option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Invalid option value: " << e.what() << "\n";
        return 1;
    }

    std::string configWarning;
    PipelineConfig config = loadPipelineConfig(configPath, configWarning);
    if (!ocrBackend.empty()) config.ocr.backend = ocrBackend;
    if (!fragmentsDir.empty()) config.ocr.fragmentsDir = fragmentsDir;
    if (!outputDir.empty()) config.storage.root = outputDir;
    if (xTolerance >= 0.0) config.matcher.xTolerance = xTolerance;

    if (verbose) {
        setLogLevel(LogLevel::DEBUG);
    } else if (auto level = parseLogLevel(config.logLevel)) {
        setLogLevel(*level);
    } else {
        setLogLevel(LogLevel::INFO);
        logWarning("Unknown log_level '" + config.logLevel + "', using info");
    }
    if (!configWarning.empty()) {
        logWarning(configWarning);
    }

    std::unique_ptr<OcrEngine> ocr;
    try {
        ocr = createOcrEngine(config.ocr);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: OCR init failed: " << e.what() << "\n";
        return 1;
    }
    logInfo("OCR backend: " + ocr->name());

    ChartExtractor extractor(*ocr, config);

    // ---------------------------------------------------------------------
    // Single image diagnostics
    // ---------------------------------------------------------------------
    if (!singleImage.empty()) {
        const ImageExtraction result = extractor.processFileDetailed(singleImage);
        printExtraction(result);

        if (!jsonOutputPath.empty()) {
            std::ofstream out(jsonOutputPath, std::ios::trunc);
            if (!out.good()) {
                std::cerr << "ERROR: Cannot open for writing: " << jsonOutputPath << "\n";
                return 1;
            }
            out << extractionToJson(result).dump(2) << std::endl;
            std::cout << "Diagnostics written to " << jsonOutputPath << std::endl;
        }
        return result.failed() ? 1 : 0;
    }

    if (!jsonOutputPath.empty()) {
        logWarning("--json-output only applies with --image");
    }

    // ---------------------------------------------------------------------
    // Batch mode
    // ---------------------------------------------------------------------
    CsvTableStore store(config.storage.root);
    BatchRunner runner(extractor, store, config, options);

    RunSummary summary;
    try {
        summary = runner.run(imagesDir);
    } catch (const StorageError& e) {
        std::cerr << "ERROR: Storage failure: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nProcessed " << summary.processed << " images: "
              << summary.succeeded << " OK, " << summary.noData << " no data, "
              << summary.failed << " failed\n"
              << "New records: " << summary.newRecords << ", table rows: " << summary.totalRows << "\n"
              << "Tables: " << store.pathFor(config.storage.wideKey) << ", "
              << store.pathFor(config.storage.confidenceKey) << std::endl;

    return 0;
}
