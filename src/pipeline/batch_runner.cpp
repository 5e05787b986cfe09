/**
 * @file batch_runner.cpp
 * @brief Directory processing with incremental table saves
 */

#include "pipeline/batch_runner.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace eps_monitor {

namespace {

bool hasPngExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png";
}

} // namespace

BatchRunner::BatchRunner(ChartExtractor& extractor, TableStore& store,
                         const PipelineConfig& config, const BatchOptions& options)
    : m_extractor(extractor),
      m_store(store),
      m_storage(config.storage),
      m_confidenceConfig(config.confidence),
      m_options(options) {}

std::vector<std::string> BatchRunner::collectImages(const std::string& imageDir) {
    std::error_code ec;
    if (!fs::is_directory(imageDir, ec)) {
        throw std::runtime_error("Image directory not found: " + imageDir);
    }

    std::vector<std::string> images;
    for (const auto& entry : fs::directory_iterator(imageDir, ec)) {
        if (entry.is_regular_file() && hasPngExtension(entry.path())) {
            images.push_back(entry.path().string());
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot list " + imageDir + ": " + ec.message());
    }

    std::sort(images.begin(), images.end(), [](const std::string& a, const std::string& b) {
        return fs::path(a).filename().string() < fs::path(b).filename().string();
    });
    return images;
}

std::vector<std::string> BatchRunner::selectImages(const std::vector<std::string>& images,
                                                   const EstimateTable& existing) const {
    std::vector<std::string> selected;
    size_t skipped = 0;

    for (const auto& path : images) {
        if (!m_options.reprocess) {
            const ReportDate date = m_parser.reportDateFromFilename(fs::path(path).filename().string());
            if (date.valid && existing.hasDate(date.iso)) {
                ++skipped;
                continue;
            }
        }
        selected.push_back(path);
    }

    if (skipped > 0) {
        logInfo("Skipping " + std::to_string(skipped) + " already-processed images");
    }

    if (m_options.limit > 0 && selected.size() > m_options.limit) {
        selected.resize(m_options.limit);
    }
    return selected;
}

void BatchRunner::loadTables() {
    m_wide = EstimateTable();
    m_confidence = ConfidenceTable();

    if (auto csv = m_store.load(m_storage.wideKey)) {
        m_wide = EstimateTable::fromCsv(*csv);
    }
    if (auto csv = m_store.load(m_storage.confidenceKey)) {
        m_confidence = ConfidenceTable::fromCsv(*csv);
    }

    logInfo("Existing table: " + std::to_string(m_wide.size()) + " rows, " +
            std::to_string(m_wide.quarters().size()) + " quarters");
}

void BatchRunner::saveTables() {
    // Confidence goes first: a date counts as processed once it is in the wide table
    try {
        m_store.save(m_storage.confidenceKey, m_confidence.toCsv());
        m_store.save(m_storage.wideKey, m_wide.toCsv());
    } catch (const StorageError& e) {
        logError(std::string("Failed to save tables: ") + e.what());
        throw;
    }
}

RunSummary BatchRunner::run(const std::string& imageDir) {
    RunSummary summary;

    try {
        loadTables();
    } catch (const StorageError& e) {
        logError(std::string("Failed to load tables: ") + e.what());
        throw;
    }

    const std::vector<std::string> images = selectImages(collectImages(imageDir), m_wide);
    logInfo("Processing " + std::to_string(images.size()) + " images from " + imageDir);

    for (size_t i = 0; i < images.size(); ++i) {
        const std::string name = fs::path(images[i]).filename().string();
        if (m_options.progress) {
            std::cout << "[" << (i + 1) << "/" << images.size() << "] " << name << " ... " << std::flush;
        }

        const ImageExtraction result = m_extractor.processFileDetailed(images[i]);
        ++summary.processed;

        if (result.failed()) {
            ++summary.failed;
            if (m_options.progress) std::cout << "FAILED" << std::endl;
            continue;
        }
        if (result.records.empty()) {
            ++summary.noData;
            if (m_options.progress) std::cout << "no data" << std::endl;
            continue;
        }

        MergeResult merged = mergeRecords(m_wide, m_confidence, result.records, m_confidenceConfig);
        m_wide = std::move(merged.wide);
        m_confidence = std::move(merged.confidence);
        saveTables();

        ++summary.succeeded;
        summary.newRecords += result.records.size();
        if (m_options.progress) {
            std::cout << "OK (" << result.records.size() << " records)" << std::endl;
        }
    }

    summary.totalRows = m_wide.size();
    return summary;
}

} // namespace eps_monitor
