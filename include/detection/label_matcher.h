#pragma once
/**
 * @file label_matcher.h
 * @brief Coordinate-based pairing of quarter labels with EPS value labels
 *
 * Chart archetype: quarter labels run along the bottom axis, each bar has
 * its EPS value printed directly above it.
 */

#include "types.h"
#include "detection/quarter_parser.h"
#include <optional>
#include <vector>

namespace eps_monitor {

/**
 * @brief Quarter label fragment found in the bottom band
 */
struct QuarterBox {
    Fragment box;
    QuarterLabel quarter;
};

/**
 * @brief Number fragment chosen for a quarter label
 */
struct NumberCandidate {
    Fragment box;
    double value = 0.0;
    double xDiff = 0.0;
    double yDiff = 0.0;
    double distance = 0.0;
};

class LabelMatcher {
public:
    explicit LabelMatcher(const MatcherConfig& config = MatcherConfig{});

    /**
     * @brief Match every bottom-band quarter label with its value label
     * @param fragments All OCR fragments of one chart image
     * @return One pair per quarter label that found a number, left to right
     */
    std::vector<MatchedPair> match(const std::vector<Fragment>& fragments) const;

    /**
     * @brief Quarter labels whose box bottom lies in the bottom band, sorted by left
     */
    std::vector<QuarterBox> findQuarterBoxes(const std::vector<Fragment>& fragments) const;

    /**
     * @brief Best number box strictly above a quarter box
     *
     * Distance is sqrt(10*dx^2 + 0.1*dy^2) so horizontal alignment dominates.
     */
    std::optional<NumberCandidate> findNumberBox(const QuarterBox& quarterBox,
                                                 const std::vector<Fragment>& fragments) const;

    static double weightedDistance(double xDiff, double yDiff);

    const MatcherConfig& config() const { return m_config; }
    void setXTolerance(double pixels) { m_config.xTolerance = pixels; }

private:
    MatcherConfig m_config;
    QuarterParser m_parser;
};

} // namespace eps_monitor
