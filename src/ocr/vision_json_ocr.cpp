/**
 * @file vision_json_ocr.cpp
 * @brief Cached text-detection output loader
 */

#include "ocr/vision_json_ocr.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace eps_monitor {

using json = nlohmann::json;
namespace fs = std::filesystem;

VisionJsonOcr::VisionJsonOcr(std::string fragmentsDir) : m_fragmentsDir(std::move(fragmentsDir)) {}

std::string VisionJsonOcr::fragmentsPathFor(const std::string& imageName) const {
    fs::path p(imageName);
    return (fs::path(m_fragmentsDir) / (p.stem().string() + ".json")).string();
}

static Fragment annotationToFragment(const json& annotation, bool& ok) {
    Fragment f;
    ok = false;

    if (!annotation.contains("boundingPoly")) return f;
    const json& poly = annotation["boundingPoly"];
    if (!poly.contains("vertices") || !poly["vertices"].is_array()) return f;
    const json& vertices = poly["vertices"];
    if (vertices.size() < 3) return f;

    // Vertices omit zero coordinates
    double minX = 0, maxX = 0, minY = 0, maxY = 0;
    bool first = true;
    for (const auto& v : vertices) {
        const double x = v.value("x", 0.0);
        const double y = v.value("y", 0.0);
        if (first) {
            minX = maxX = x;
            minY = maxY = y;
            first = false;
        } else {
            minX = (std::min)(minX, x);
            maxX = (std::max)(maxX, x);
            minY = (std::min)(minY, y);
            maxY = (std::max)(maxY, y);
        }
    }

    f.text = annotation.value("description", "");
    f.left = minX;
    f.top = minY;
    f.width = maxX - minX;
    f.height = maxY - minY;
    f.confidence = annotation.value("confidence", 1.0) * 100.0;
    ok = true;
    return f;
}

std::vector<Fragment> VisionJsonOcr::parseFragments(const json& doc) {
    std::vector<Fragment> fragments;

    if (doc.is_object() && doc.contains("textAnnotations")) {
        const json& annotations = doc["textAnnotations"];
        if (!annotations.is_array()) {
            throw std::runtime_error("textAnnotations is not an array");
        }
        for (size_t i = 1; i < annotations.size(); ++i) {
            bool ok = false;
            Fragment f = annotationToFragment(annotations[i], ok);
            if (ok) fragments.push_back(std::move(f));
        }
        return fragments;
    }

    if (doc.is_array()) {
        for (const auto& item : doc) {
            Fragment f;
            f.text = item.value("text", "");
            f.left = item.value("left", 0.0);
            f.top = item.value("top", 0.0);
            f.width = item.value("width", 0.0);
            f.height = item.value("height", 0.0);
            f.confidence = item.value("conf", 100.0);
            fragments.push_back(std::move(f));
        }
        return fragments;
    }

    throw std::runtime_error("unrecognized OCR document layout");
}

std::vector<Fragment> VisionJsonOcr::recognize(const std::vector<uint8_t>& imageBytes,
                                               const std::string& imageName) {
    (void)imageBytes;

    const std::string path = fragmentsPathFor(imageName);
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Cannot open OCR fragments file: " + path);
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception& e) {
        throw std::runtime_error("Error parsing OCR fragments " + path + ": " + e.what());
    }

    auto fragments = parseFragments(doc);
    logDebug("Loaded " + std::to_string(fragments.size()) + " fragments from " + path);
    return fragments;
}

} // namespace eps_monitor
