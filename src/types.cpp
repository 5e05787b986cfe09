/**
 * @file types.cpp
 * @brief Quarter label and enum helpers
 */

#include "types.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace eps_monitor {

QuarterLabel::QuarterLabel(int quarter, int yy) : m_quarter(quarter), m_yy(yy) {
    if (quarter < 1 || quarter > 4) {
        throw std::invalid_argument("quarter out of range: " + std::to_string(quarter));
    }
    if (yy < 0 || yy > 99) {
        throw std::invalid_argument("two-digit year out of range: " + std::to_string(yy));
    }
}

std::optional<QuarterLabel> QuarterLabel::fromText(const std::string& text) {
    // Exactly Q{1-4}'{DD}
    if (text.size() != 5 || text[0] != 'Q' || text[2] != '\'') {
        return std::nullopt;
    }
    const char q = text[1];
    if (q < '1' || q > '4') return std::nullopt;
    if (!std::isdigit(static_cast<unsigned char>(text[3])) ||
        !std::isdigit(static_cast<unsigned char>(text[4]))) {
        return std::nullopt;
    }
    return QuarterLabel(q - '0', (text[3] - '0') * 10 + (text[4] - '0'));
}

QuarterLabel QuarterLabel::fromYearQuarter(int year, int quarter) {
    if (year < 1950 || year > 2049) {
        throw std::invalid_argument("year not representable as a quarter label: " + std::to_string(year));
    }
    return QuarterLabel(quarter, year % 100);
}

std::string QuarterLabel::text() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "Q%d'%02d", m_quarter, m_yy);
    return buf;
}

const char* toString(BarColor color) {
    switch (color) {
        case BarColor::DARK:  return "dark";
        case BarColor::LIGHT: return "light";
    }
    return "light";
}

const char* toString(BarConfidence confidence) {
    switch (confidence) {
        case BarConfidence::HIGH:   return "high";
        case BarConfidence::MEDIUM: return "medium";
        case BarConfidence::LOW:    return "low";
    }
    return "low";
}

std::optional<BarColor> parseBarColor(const std::string& text) {
    if (text == "dark") return BarColor::DARK;
    if (text == "light") return BarColor::LIGHT;
    return std::nullopt;
}

std::optional<BarConfidence> parseBarConfidence(const std::string& text) {
    if (text == "high") return BarConfidence::HIGH;
    if (text == "medium") return BarConfidence::MEDIUM;
    if (text == "low") return BarConfidence::LOW;
    return std::nullopt;
}

} // namespace eps_monitor
