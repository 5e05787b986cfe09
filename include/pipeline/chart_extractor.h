#pragma once
/**
 * @file chart_extractor.h
 * @brief Per-image extraction: OCR -> label matching -> bar classification -> records
 */

#include "types.h"
#include "detection/label_matcher.h"
#include "detection/quarter_parser.h"
#include "ocr/ocr_engine.h"
#include "processing/bar_classifier.h"

#include <cstdint>
#include <string>
#include <vector>

namespace eps_monitor {

/**
 * @brief Everything learned about one chart image
 */
struct ImageExtraction {
    std::string imageName;
    ReportDate reportDate;
    size_t fragmentCount = 0;
    std::vector<MatchedPair> pairs;             ///< Classified pairs (diagnostics)
    std::vector<ExtractionRecord> records;      ///< Empty on any failure
    ExtractionStats stats;
    std::string error;                          ///< Set when the image failed

    bool failed() const { return !error.empty(); }
};

class ChartExtractor {
public:
    /**
     * @param ocr OCR engine, must outlive the extractor
     */
    ChartExtractor(OcrEngine& ocr, const PipelineConfig& config);

    /**
     * @brief Extract records from an image file
     *
     * Never throws for per-image problems: they are logged and the image
     * contributes no records.
     */
    std::vector<ExtractionRecord> processImage(const std::string& imagePath);

    /**
     * @brief Extract records from encoded image bytes
     * @param imageName Filename carrying the YYYYMMDD report date
     * @param imageBytes Encoded image
     */
    ImageExtraction processImageDetailed(const std::string& imageName,
                                         const std::vector<uint8_t>& imageBytes);

    /**
     * @brief File variant of processImageDetailed
     */
    ImageExtraction processFileDetailed(const std::string& imagePath);

    const LabelMatcher& matcher() const { return m_matcher; }
    LabelMatcher& matcher() { return m_matcher; }

private:
    OcrEngine& m_ocr;
    QuarterParser m_parser;
    LabelMatcher m_matcher;
    BarClassifier m_classifier;
};

} // namespace eps_monitor
