/**
 * @file bar_classifier.cpp
 * @brief Bar fill classification using three OpenCV binarizations
 */

#include "processing/bar_classifier.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <stdexcept>

namespace eps_monitor {

namespace {

inline int clampi(int v, int lo, int hi) { return (std::max)(lo, (std::min)(v, hi)); }

} // namespace

BarClassifier::BarClassifier(const BarClassifierConfig& config) : m_config(config) {
    if (m_config.adaptiveBlockSize < 3 || m_config.adaptiveBlockSize % 2 == 0) {
        throw std::invalid_argument("adaptive block size must be odd and >= 3");
    }
    if (m_config.regionWidth <= 0 || m_config.closingKernel <= 0) {
        throw std::invalid_argument("region width and closing kernel must be positive");
    }
}

BarPreprocess BarClassifier::preprocess(const cv::Mat& image) const {
    if (image.empty()) {
        throw std::invalid_argument("cannot classify bars of an empty image");
    }

    BarPreprocess pre;
    switch (image.channels()) {
        case 1: pre.gray = image.clone(); break;
        case 3: cv::cvtColor(image, pre.gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, pre.gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw std::invalid_argument("unsupported channel count: " + std::to_string(image.channels()));
    }

    cv::adaptiveThreshold(pre.gray, pre.adaptive, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, m_config.adaptiveBlockSize, m_config.adaptiveC);

    cv::Mat otsu;
    cv::threshold(pre.gray, otsu, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    const cv::Mat kernel = cv::Mat::ones(m_config.closingKernel, m_config.closingKernel, CV_8U);
    cv::morphologyEx(otsu, pre.closing, cv::MORPH_CLOSE, kernel);

    cv::threshold(pre.gray, pre.otsuInv, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

    return pre;
}

BarRegion BarClassifier::barRegion(const Fragment& quarterBox, const Fragment& numberBox,
                                   int imageWidth, int imageHeight) const {
    const int xCenter = static_cast<int>((quarterBox.centerX() + numberBox.centerX()) / 2.0);
    const double halfWidth = m_config.regionWidth / 2.0;

    BarRegion r;
    r.xMin = (std::max)(0, static_cast<int>(xCenter - halfWidth));
    r.xMax = (std::min)(imageWidth, static_cast<int>(xCenter + halfWidth));

    // Gap between the bottom of the value label and the top of the quarter label
    r.yTop = clampi(static_cast<int>(numberBox.bottom()), 0, imageHeight);
    r.yBottom = clampi(static_cast<int>(quarterBox.top), 0, imageHeight);
    return r;
}

double BarClassifier::whiteRatio(const cv::Mat& crop) {
    if (crop.empty()) return 0.0;
    const double total = static_cast<double>(crop.total());
    const double white = static_cast<double>(cv::countNonZero(crop == 255));
    return white / total;
}

BarColor BarClassifier::classifyAdaptive(const cv::Mat& crop) const {
    if (crop.empty()) return BarColor::LIGHT;
    return whiteRatio(crop) > m_config.adaptiveDarkRatio ? BarColor::DARK : BarColor::LIGHT;
}

BarColor BarClassifier::classifyClosing(const cv::Mat& crop) const {
    if (crop.empty()) return BarColor::LIGHT;
    // Closing fills hatch gaps: a fully white region is a solid light bar
    return whiteRatio(crop) > m_config.closingLightRatio ? BarColor::LIGHT : BarColor::DARK;
}

BarColor BarClassifier::classifyOtsuInverted(const cv::Mat& crop) const {
    if (crop.empty()) return BarColor::LIGHT;
    return whiteRatio(crop) > m_config.otsuInvDarkRatio ? BarColor::DARK : BarColor::LIGHT;
}

BarConfidence BarClassifier::confidenceFromVotes(int winningVotes) {
    if (winningVotes >= 3) return BarConfidence::HIGH;
    if (winningVotes == 2) return BarConfidence::MEDIUM;
    return BarConfidence::LOW;
}

BarClassification BarClassifier::classifyRegion(const BarPreprocess& pre, const BarRegion& region) const {
    BarClassification result;

    if (region.empty()) {
        result.color = BarColor::LIGHT;
        result.confidence = BarConfidence::LOW;
        return result;
    }

    const cv::Rect rect = region.rect();
    result.methods["adaptive"] = classifyAdaptive(pre.adaptive(rect));
    result.methods["closing"] = classifyClosing(pre.closing(rect));
    result.methods["otsu_inv"] = classifyOtsuInverted(pre.otsuInv(rect));

    for (const auto& kv : result.methods) {
        if (kv.second == BarColor::DARK) {
            result.darkVotes++;
        } else {
            result.lightVotes++;
        }
    }

    result.color = result.darkVotes > result.lightVotes ? BarColor::DARK : BarColor::LIGHT;
    const int winning = (result.color == BarColor::DARK) ? result.darkVotes : result.lightVotes;
    result.confidence = confidenceFromVotes(winning);
    return result;
}

std::vector<MatchedPair> BarClassifier::classifyAll(const cv::Mat& image, std::vector<MatchedPair> pairs) const {
    if (pairs.empty()) {
        return pairs;
    }

    const BarPreprocess pre = preprocess(image);

    for (auto& pair : pairs) {
        const BarRegion region = barRegion(pair.quarterBox, pair.numberBox, image.cols, image.rows);
        pair.bar = classifyRegion(pre, region);
    }

    return pairs;
}

} // namespace eps_monitor
