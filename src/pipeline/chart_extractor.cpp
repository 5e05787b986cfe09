/**
 * @file chart_extractor.cpp
 * @brief Per-image extraction pipeline
 */

#include "pipeline/chart_extractor.h"
#include "utils/image_loader.h"
#include "utils/logger.h"
#include "utils/timer.h"

#include <filesystem>
#include <stdexcept>

namespace eps_monitor {

ChartExtractor::ChartExtractor(OcrEngine& ocr, const PipelineConfig& config)
    : m_ocr(ocr),
      m_matcher(config.matcher),
      m_classifier(config.barClassifier) {}

ImageExtraction ChartExtractor::processImageDetailed(const std::string& imageName,
                                                     const std::vector<uint8_t>& imageBytes) {
    ImageExtraction out;
    out.imageName = imageName;

    HighResTimer total;
    total.start();

    try {
        std::vector<Fragment> fragments;
        {
            EM_SCOPE_TIMER(out.stats.ocrMs);
            fragments = m_ocr.recognize(imageBytes, imageName);
        }
        out.fragmentCount = fragments.size();
        logDebug(imageName + ": " + std::to_string(fragments.size()) + " OCR fragments");

        if (fragments.empty()) {
            logWarning("No OCR results for image: " + imageName);
            out.stats.totalMs = total.currentElapsedMs();
            return out;
        }

        std::vector<MatchedPair> pairs;
        {
            EM_SCOPE_TIMER(out.stats.matchMs);
            pairs = m_matcher.match(fragments);
        }
        logDebug(imageName + ": " + std::to_string(pairs.size()) + " matched pairs");

        if (pairs.empty()) {
            logWarning("No matched results for image: " + imageName);
            out.stats.totalMs = total.currentElapsedMs();
            return out;
        }

        cv::Mat image;
        {
            EM_SCOPE_TIMER(out.stats.decodeMs);
            image = decodeImage(imageBytes);
        }
        if (image.empty()) {
            throw std::runtime_error("Cannot decode image");
        }

        {
            EM_SCOPE_TIMER(out.stats.classifyMs);
            out.pairs = m_classifier.classifyAll(image, std::move(pairs));
        }

        out.reportDate = m_parser.reportDateFromFilename(imageName);
        if (!out.reportDate.valid) {
            throw std::runtime_error("No YYYYMMDD report date in filename");
        }

        out.records.reserve(out.pairs.size());
        for (const auto& pair : out.pairs) {
            const BarColor color = pair.bar ? pair.bar->color : BarColor::LIGHT;
            std::optional<BarConfidence> confidence;
            if (pair.bar) confidence = pair.bar->confidence;

            out.records.push_back(ExtractionRecord{
                out.reportDate.iso, pair.quarter, pair.eps, color, confidence,
                color == BarColor::LIGHT});
        }
    } catch (const std::exception& e) {
        logError("Error processing image: " + imageName + " - " + e.what());
        out.error = e.what();
        out.records.clear();
    }

    out.stats.totalMs = total.currentElapsedMs();
    return out;
}

ImageExtraction ChartExtractor::processFileDetailed(const std::string& imagePath) {
    const std::string imageName = std::filesystem::path(imagePath).filename().string();

    std::vector<uint8_t> bytes;
    std::string err;
    if (!readFileBytes(imagePath, bytes, err)) {
        logError(err);
        ImageExtraction out;
        out.imageName = imageName;
        out.error = err;
        return out;
    }

    return processImageDetailed(imageName, bytes);
}

std::vector<ExtractionRecord> ChartExtractor::processImage(const std::string& imagePath) {
    return processFileDetailed(imagePath).records;
}

} // namespace eps_monitor
