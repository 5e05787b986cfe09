#pragma once
/**
 * @file bar_classifier.h
 * @brief Dark (actual) vs light (estimate) bar fill classification
 *
 * Three independent binarizations of the chart vote on each bar:
 * - adaptive:  Gaussian adaptive threshold, white ratio > 0.7 -> dark
 * - closing:   OTSU + 3x3 closing, white ratio > 0.5 -> light (inverted sense)
 * - otsu_inv:  inverted OTSU, white ratio > 0.7 -> dark
 */

#include "types.h"

#include <opencv2/core.hpp>

#include <vector>

namespace eps_monitor {

/**
 * @brief Binary images derived once per chart and shared by all bars
 */
struct BarPreprocess {
    cv::Mat gray;
    cv::Mat adaptive;
    cv::Mat closing;
    cv::Mat otsuInv;
};

/**
 * @brief Crop bounds of the bar between a value label and its quarter label
 *
 * Half-open on both axes: [xMin, xMax) x [yTop, yBottom).
 */
struct BarRegion {
    int xMin = 0;
    int xMax = 0;
    int yTop = 0;
    int yBottom = 0;

    bool empty() const { return xMax <= xMin || yBottom <= yTop; }
    cv::Rect rect() const { return cv::Rect(xMin, yTop, xMax - xMin, yBottom - yTop); }
};

class BarClassifier {
public:
    explicit BarClassifier(const BarClassifierConfig& config = BarClassifierConfig{});

    /**
     * @brief Classify every matched pair of one chart image
     * @param image Chart image (BGR, BGRA or grayscale)
     * @param pairs Matched pairs from LabelMatcher
     * @return Same pairs with bar classification attached
     */
    std::vector<MatchedPair> classifyAll(const cv::Mat& image, std::vector<MatchedPair> pairs) const;

    /**
     * @brief Grayscale conversion plus the three binarizations
     */
    BarPreprocess preprocess(const cv::Mat& image) const;

    /**
     * @brief Bar region for a pair, clipped to the image
     */
    BarRegion barRegion(const Fragment& quarterBox, const Fragment& numberBox,
                        int imageWidth, int imageHeight) const;

    /**
     * @brief Vote on one region of preprocessed images
     */
    BarClassification classifyRegion(const BarPreprocess& pre, const BarRegion& region) const;

    BarColor classifyAdaptive(const cv::Mat& crop) const;
    BarColor classifyClosing(const cv::Mat& crop) const;
    BarColor classifyOtsuInverted(const cv::Mat& crop) const;

    /**
     * @brief Fraction of pixels equal to 255 (0 for an empty crop)
     */
    static double whiteRatio(const cv::Mat& crop);

    /**
     * @brief Confidence tag from the winning vote count
     */
    static BarConfidence confidenceFromVotes(int winningVotes);

    const BarClassifierConfig& config() const { return m_config; }

private:
    BarClassifierConfig m_config;
};

} // namespace eps_monitor
