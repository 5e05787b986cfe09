/**
 * @file label_matcher.cpp
 * @brief Coordinate-based label matching implementation
 */

#include "detection/label_matcher.h"
#include "utils/logger.h"

#include <algorithm>
#include <cmath>

namespace eps_monitor {

LabelMatcher::LabelMatcher(const MatcherConfig& config) : m_config(config) {}

double LabelMatcher::weightedDistance(double xDiff, double yDiff) {
    return std::sqrt(xDiff * xDiff * 10.0 + yDiff * yDiff * 0.1);
}

std::vector<QuarterBox> LabelMatcher::findQuarterBoxes(const std::vector<Fragment>& fragments) const {
    std::vector<QuarterBox> quarterBoxes;
    if (fragments.empty()) {
        return quarterBoxes;
    }

    double maxY = 0.0;
    for (const auto& f : fragments) {
        maxY = (std::max)(maxY, f.bottom());
    }
    const double bottomThreshold = maxY * (1.0 - m_config.bottomPercent);

    for (const auto& f : fragments) {
        if (f.bottom() < bottomThreshold) continue;
        auto quarter = m_parser.extractQuarter(f.text);
        if (quarter) {
            quarterBoxes.push_back(QuarterBox{f, *quarter});
        }
    }

    std::stable_sort(quarterBoxes.begin(), quarterBoxes.end(),
                     [](const QuarterBox& a, const QuarterBox& b) { return a.box.left < b.box.left; });
    return quarterBoxes;
}

std::optional<NumberCandidate> LabelMatcher::findNumberBox(const QuarterBox& quarterBox,
                                                           const std::vector<Fragment>& fragments) const {
    const double qCenterX = quarterBox.box.centerX();
    const double qCenterY = quarterBox.box.centerY();

    std::optional<NumberCandidate> best;

    for (const auto& f : fragments) {
        if (f.sameBox(quarterBox.box)) continue;

        // Other quarter labels are never values
        if (m_parser.extractQuarter(f.text)) continue;

        auto number = m_parser.extractNumber(f.text);
        if (!number) continue;

        const double centerY = f.centerY();
        if (centerY >= qCenterY) continue;

        const double yDiff = qCenterY - centerY;
        if (yDiff > m_config.yTolerance) continue;

        const double xDiff = std::abs(f.centerX() - qCenterX);
        if (xDiff > m_config.xTolerance) continue;

        // Four-digit values in this region are years, not EPS
        if (*number >= m_config.maxEpsValue) continue;

        const double distance = weightedDistance(xDiff, yDiff);
        if (!best || distance < best->distance) {
            best = NumberCandidate{f, *number, xDiff, yDiff, distance};
        }
    }

    return best;
}

std::vector<MatchedPair> LabelMatcher::match(const std::vector<Fragment>& fragments) const {
    std::vector<MatchedPair> pairs;

    const auto quarterBoxes = findQuarterBoxes(fragments);
    if (quarterBoxes.empty()) {
        logDebug("No quarter labels in bottom band");
        return pairs;
    }

    for (const auto& qb : quarterBoxes) {
        auto number = findNumberBox(qb, fragments);
        if (!number) {
            logDebug("No value label above " + qb.quarter.text() + " ('" + qb.box.text + "')");
            continue;
        }

        // Duplicate quarter labels keep the leftmost match
        const bool seen = std::any_of(pairs.begin(), pairs.end(),
                                      [&](const MatchedPair& p) { return p.quarter == qb.quarter; });
        if (seen) {
            logDebug("Duplicate quarter label " + qb.quarter.text() + " ignored");
            continue;
        }

        pairs.push_back(MatchedPair{qb.quarter, number->value, qb.box, number->box,
                                    number->distance, std::nullopt});
    }

    return pairs;
}

} // namespace eps_monitor
