#pragma once
/**
 * @file types.h
 * @brief Common type definitions for the EPS chart extractor
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace eps_monitor {

/**
 * @brief One OCR text fragment with its bounding box (pixels)
 */
struct Fragment {
    std::string text;           ///< Recognized text
    double left = 0.0;          ///< Top-left X coordinate
    double top = 0.0;           ///< Top-left Y coordinate
    double width = 0.0;         ///< Box width
    double height = 0.0;        ///< Box height
    double confidence = 0.0;    ///< OCR confidence (0-100)

    double centerX() const { return left + width / 2.0; }
    double centerY() const { return top + height / 2.0; }
    double bottom() const { return top + height; }

    bool sameBox(const Fragment& other) const {
        return left == other.left && top == other.top &&
               width == other.width && height == other.height;
    }
};

/**
 * @brief Canonical fiscal quarter label, rendered as Q{1-4}'{YY}
 */
class QuarterLabel {
public:
    /**
     * @param quarter Quarter number (1-4)
     * @param yy Two-digit year (0-99)
     * @throws std::invalid_argument when either value is out of range
     */
    QuarterLabel(int quarter, int yy);

    /**
     * @brief Parse the canonical form only (e.g. "Q1'17")
     */
    static std::optional<QuarterLabel> fromText(const std::string& text);

    /**
     * @brief Build from a full year (e.g. 2017, 1) - inverse of year()/quarter()
     */
    static QuarterLabel fromYearQuarter(int year, int quarter);

    int quarter() const { return m_quarter; }
    int yy() const { return m_yy; }

    /// 2000+YY for YY < 50, 1900+YY otherwise
    int year() const { return m_yy < 50 ? 2000 + m_yy : 1900 + m_yy; }

    std::string text() const;

    bool operator<(const QuarterLabel& other) const {
        if (year() != other.year()) return year() < other.year();
        return m_quarter < other.m_quarter;
    }
    bool operator==(const QuarterLabel& other) const {
        return m_quarter == other.m_quarter && m_yy == other.m_yy;
    }
    bool operator!=(const QuarterLabel& other) const { return !(*this == other); }

private:
    int m_quarter;
    int m_yy;
};

enum class BarColor {
    DARK,   ///< Actual reported EPS
    LIGHT   ///< Analyst estimate
};

enum class BarConfidence {
    HIGH,   ///< 3/3 votes
    MEDIUM, ///< 2/3 votes
    LOW     ///< Degenerate region
};

const char* toString(BarColor color);
const char* toString(BarConfidence confidence);
std::optional<BarColor> parseBarColor(const std::string& text);
std::optional<BarConfidence> parseBarConfidence(const std::string& text);

/**
 * @brief Result of the three-method bar fill vote
 */
struct BarClassification {
    BarColor color = BarColor::LIGHT;
    BarConfidence confidence = BarConfidence::LOW;
    int darkVotes = 0;
    int lightVotes = 0;
    std::map<std::string, BarColor> methods;    ///< method name -> vote (empty when degenerate)
};

/**
 * @brief Quarter label paired with the number printed above its bar
 */
struct MatchedPair {
    QuarterLabel quarter;
    double eps = 0.0;
    Fragment quarterBox;
    Fragment numberBox;
    double distance = 0.0;                      ///< Weighted distance, diagnostics only
    std::optional<BarClassification> bar;       ///< Set by BarClassifier
};

/**
 * @brief Report publication date derived from an image filename
 */
struct ReportDate {
    std::string iso;        ///< YYYY-MM-DD, or the raw filename when !valid
    bool valid = false;
};

/**
 * @brief One quarter observation from one chart image (long form)
 */
struct ExtractionRecord {
    std::string reportDate;                     ///< YYYY-MM-DD
    QuarterLabel quarter;
    double eps = 0.0;
    BarColor barColor = BarColor::LIGHT;
    std::optional<BarConfidence> barConfidence;
    bool isEstimate = true;
};

/**
 * @brief Per-image timing statistics
 */
struct ExtractionStats {
    double decodeMs = 0.0;      ///< Image decode time
    double ocrMs = 0.0;         ///< OCR engine time
    double matchMs = 0.0;       ///< Coordinate matching time
    double classifyMs = 0.0;    ///< Bar classification time
    double totalMs = 0.0;       ///< Total per-image time

    void reset() {
        decodeMs = ocrMs = matchMs = classifyMs = totalMs = 0.0;
    }
};

/**
 * @brief Coordinate matcher settings
 */
struct MatcherConfig {
    double bottomPercent = 0.3;     ///< Bottom band considered for quarter labels
    double yTolerance = 1000.0;     ///< Max vertical center distance to a number box
    double xTolerance = 10.0;       ///< Max horizontal center distance to a number box
    double maxEpsValue = 2000.0;    ///< Values at or above this are read as years
};

/**
 * @brief Bar fill classifier settings
 */
struct BarClassifierConfig {
    int regionWidth = 30;               ///< Crop width centred on the bar
    int adaptiveBlockSize = 11;         ///< Gaussian adaptive threshold block
    double adaptiveC = 2.0;             ///< Gaussian adaptive threshold constant
    int closingKernel = 3;              ///< Morphological closing kernel size
    double adaptiveDarkRatio = 0.7;     ///< White ratio above this -> dark
    double closingLightRatio = 0.5;     ///< White ratio above this -> light
    double otsuInvDarkRatio = 0.7;      ///< White ratio above this -> dark
};

/**
 * @brief Confidence engine settings
 */
struct ConfidenceConfig {
    double barWeight = 0.5;             ///< Weight of bar score (consistency gets 1 - barWeight)
    double consistencyTolerance = 0.2;  ///< Max relative change counted as a match
};

/**
 * @brief Table storage settings
 */
struct StorageConfig {
    std::string root = "output";
    std::string wideKey = "extracted_estimates.csv";
    std::string confidenceKey = "extracted_estimates_confidence.csv";
};

/**
 * @brief OCR backend settings
 */
struct OcrConfig {
    std::string backend = "json";       ///< "json" (cached fragments) or "tesseract"
    std::string fragmentsDir = "output/ocr";
    std::string tessdataPath;           ///< Empty = Tesseract default
    std::string language = "eng";
};

/**
 * @brief Configuration for the extraction pipeline
 */
struct PipelineConfig {
    MatcherConfig matcher;
    BarClassifierConfig barClassifier;
    ConfidenceConfig confidence;
    StorageConfig storage;
    OcrConfig ocr;
    std::string logLevel = "info";
};

} // namespace eps_monitor
