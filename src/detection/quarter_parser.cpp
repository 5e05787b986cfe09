/**
 * @file quarter_parser.cpp
 * @brief Quarter label, number and report date parsing
 */

#include "detection/quarter_parser.h"

#include <boost/regex.hpp>

#include <cstdio>
#include <stdexcept>
#include <string>

namespace eps_monitor {

namespace {

const boost::regex kLeadingZeroAsQ{R"(^[O0](?=[1-4]))", boost::regex::perl | boost::regex::icase};
const boost::regex kQuarterIAsOne{R"(Q[Il](?=\d))", boost::regex::perl | boost::regex::icase};

const boost::regex kApostrophe{R"(Q([1-4])'(\d{2}))", boost::regex::perl | boost::regex::icase};
const boost::regex kFullYear{R"(Q([1-4])\s+20(\d{2}))", boost::regex::perl | boost::regex::icase};
const boost::regex kConcatenated{R"(Q([1-4])(\d{2}))", boost::regex::perl | boost::regex::icase};
const boost::regex kZeroForQ{R"([0Oo]([1-4])(\d{2}))"};
const boost::regex kGarbledYear{R"(Q([1-4])[iIl1](\d)[yi])", boost::regex::perl | boost::regex::icase};

const boost::regex kNumber{R"(-?\d+\.?\d*)"};
const boost::regex kDateToken{R"(\d{8})"};

int toInt(const boost::ssub_match& m) {
    return std::stoi(m.str());
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool isCalendarDate(int year, int month, int day) {
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    int maxDay = kDaysInMonth[month - 1];
    if (month == 2 && isLeapYear(year)) maxDay = 29;
    return day <= maxDay;
}

} // namespace

bool QuarterParser::plausibleYear(int yy) {
    return (yy >= 14 && yy <= 99) || (yy >= 0 && yy <= 25);
}

std::string QuarterParser::normalize(const std::string& text) const {
    std::string out = boost::regex_replace(text, kLeadingZeroAsQ, "Q");
    out = boost::regex_replace(out, kQuarterIAsOne, "Q1");
    return out;
}

std::optional<QuarterLabel> QuarterParser::extractQuarter(const std::string& text) const {
    const std::string normalized = normalize(text);
    boost::smatch m;

    if (boost::regex_search(normalized, m, kApostrophe)) {
        return QuarterLabel(toInt(m[1]), toInt(m[2]));
    }

    if (boost::regex_search(normalized, m, kFullYear)) {
        return QuarterLabel(toInt(m[1]), toInt(m[2]));
    }

    if (boost::regex_search(normalized, m, kConcatenated)) {
        const int yy = toInt(m[2]);
        if (plausibleYear(yy)) {
            return QuarterLabel(toInt(m[1]), yy);
        }
    }

    if (boost::regex_search(normalized, m, kZeroForQ)) {
        const int yy = toInt(m[2]);
        if (plausibleYear(yy)) {
            return QuarterLabel(toInt(m[1]), yy);
        }
    }

    if (boost::regex_search(normalized, m, kGarbledYear)) {
        // Single surviving year digit: 7/8/9 belong to the 2010s, the rest to the 2020s
        const int digit = toInt(m[2]);
        const int yy = (digit >= 7) ? 10 + digit : 20 + digit;
        return QuarterLabel(toInt(m[1]), yy);
    }

    return std::nullopt;
}

std::optional<double> QuarterParser::extractNumber(const std::string& text) const {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == ',' || c == '-') continue;
        cleaned.push_back(c);
    }

    boost::smatch m;
    if (!boost::regex_search(cleaned, m, kNumber)) {
        return std::nullopt;
    }

    try {
        return std::stod(m.str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> QuarterParser::dateToken(const std::string& filename) const {
    boost::smatch m;
    if (!boost::regex_search(filename, m, kDateToken)) {
        return std::nullopt;
    }
    return m.str();
}

ReportDate QuarterParser::reportDateFromFilename(const std::string& filename) const {
    ReportDate result;
    result.iso = filename;

    auto token = dateToken(filename);
    if (!token) {
        return result;
    }

    const int year = std::stoi(token->substr(0, 4));
    const int month = std::stoi(token->substr(4, 2));
    const int day = std::stoi(token->substr(6, 2));
    if (!isCalendarDate(year, month, day)) {
        return result;
    }

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    result.iso = buf;
    result.valid = true;
    return result;
}

} // namespace eps_monitor
