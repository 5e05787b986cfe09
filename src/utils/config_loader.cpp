/**
 * @file config_loader.cpp
 * @brief Configuration file loading
 */

#include "utils/config_loader.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <sstream>

namespace eps_monitor {

using json = nlohmann::json;

namespace {

void readMatcher(const json& j, MatcherConfig& m) {
    m.bottomPercent = j.value("bottom_percent", m.bottomPercent);
    m.yTolerance = j.value("y_tolerance", m.yTolerance);
    m.xTolerance = j.value("x_tolerance", m.xTolerance);
    m.maxEpsValue = j.value("max_eps_value", m.maxEpsValue);
}

void readBarClassifier(const json& j, BarClassifierConfig& b) {
    b.regionWidth = j.value("region_width", b.regionWidth);
    b.adaptiveBlockSize = j.value("adaptive_block_size", b.adaptiveBlockSize);
    b.adaptiveC = j.value("adaptive_c", b.adaptiveC);
    b.closingKernel = j.value("closing_kernel", b.closingKernel);
    b.adaptiveDarkRatio = j.value("adaptive_dark_ratio", b.adaptiveDarkRatio);
    b.closingLightRatio = j.value("closing_light_ratio", b.closingLightRatio);
    b.otsuInvDarkRatio = j.value("otsu_inv_dark_ratio", b.otsuInvDarkRatio);
}

void readConfidence(const json& j, ConfidenceConfig& c) {
    c.barWeight = j.value("bar_weight", c.barWeight);
    c.consistencyTolerance = j.value("consistency_tolerance", c.consistencyTolerance);
}

void readStorage(const json& j, StorageConfig& s) {
    s.root = j.value("root", s.root);
    s.wideKey = j.value("wide_key", s.wideKey);
    s.confidenceKey = j.value("confidence_key", s.confidenceKey);
}

void readOcr(const json& j, OcrConfig& o) {
    o.backend = j.value("backend", o.backend);
    o.fragmentsDir = j.value("fragments_dir", o.fragmentsDir);
    o.tessdataPath = j.value("tessdata_path", o.tessdataPath);
    o.language = j.value("language", o.language);
}

json toJson(const PipelineConfig& config) {
    json j;
    j["matcher"] = {
        {"bottom_percent", config.matcher.bottomPercent},
        {"y_tolerance", config.matcher.yTolerance},
        {"x_tolerance", config.matcher.xTolerance},
        {"max_eps_value", config.matcher.maxEpsValue},
    };
    j["bar_classifier"] = {
        {"region_width", config.barClassifier.regionWidth},
        {"adaptive_block_size", config.barClassifier.adaptiveBlockSize},
        {"adaptive_c", config.barClassifier.adaptiveC},
        {"closing_kernel", config.barClassifier.closingKernel},
        {"adaptive_dark_ratio", config.barClassifier.adaptiveDarkRatio},
        {"closing_light_ratio", config.barClassifier.closingLightRatio},
        {"otsu_inv_dark_ratio", config.barClassifier.otsuInvDarkRatio},
    };
    j["confidence"] = {
        {"bar_weight", config.confidence.barWeight},
        {"consistency_tolerance", config.confidence.consistencyTolerance},
    };
    j["storage"] = {
        {"root", config.storage.root},
        {"wide_key", config.storage.wideKey},
        {"confidence_key", config.storage.confidenceKey},
    };
    j["ocr"] = {
        {"backend", config.ocr.backend},
        {"fragments_dir", config.ocr.fragmentsDir},
        {"tessdata_path", config.ocr.tessdataPath},
        {"language", config.ocr.language},
    };
    j["log_level"] = config.logLevel;
    return j;
}

} // namespace

/**
 * @brief Parse configuration JSON text
 *
 * Expected format (matches config/pipeline_config.json):
 * {
 *   "matcher": { "bottom_percent": 0.3, ... },
 *   "bar_classifier": { ... },
 *   "confidence": { ... },
 *   "storage": { ... },
 *   "ocr": { ... },
 *   "log_level": "info"
 * }
 */
bool parsePipelineConfig(const std::string& text, PipelineConfig& config, std::string& errorMessage) {
    errorMessage.clear();

    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            errorMessage = "Config root is not an object";
            return false;
        }

        PipelineConfig parsed;
        if (j.contains("matcher")) readMatcher(j["matcher"], parsed.matcher);
        if (j.contains("bar_classifier")) readBarClassifier(j["bar_classifier"], parsed.barClassifier);
        if (j.contains("confidence")) readConfidence(j["confidence"], parsed.confidence);
        if (j.contains("storage")) readStorage(j["storage"], parsed.storage);
        if (j.contains("ocr")) readOcr(j["ocr"], parsed.ocr);
        parsed.logLevel = j.value("log_level", parsed.logLevel);

        config = parsed;
    } catch (const std::exception& e) {
        errorMessage = std::string("Error parsing config: ") + e.what();
        return false;
    }

    return true;
}

PipelineConfig loadPipelineConfig(const std::string& path, std::string& warning) {
    warning.clear();
    PipelineConfig config;

    std::ifstream file(path);
    if (!file.good()) {
        warning = "Cannot open config file: " + path + " (using defaults)";
        return config;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    std::string err;
    if (!parsePipelineConfig(buffer.str(), config, err)) {
        warning = path + ": " + err + " (using defaults)";
        return PipelineConfig{};
    }
    return config;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
    std::string warning;
    PipelineConfig config = loadPipelineConfig(path, warning);
    if (!warning.empty()) {
        logWarning(warning);
    }
    return config;
}

bool savePipelineConfig(const std::string& path, const PipelineConfig& config, std::string& errorMessage) {
    errorMessage.clear();

    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                errorMessage = "Cannot create directory " + p.parent_path().string() + ": " + ec.message();
                return false;
            }
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.good()) {
            errorMessage = "Cannot open config for writing: " + path;
            return false;
        }
        out << toJson(config).dump(2) << std::endl;
    } catch (const std::exception& e) {
        errorMessage = std::string("Error writing config: ") + e.what();
        return false;
    }

    return true;
}

} // namespace eps_monitor
