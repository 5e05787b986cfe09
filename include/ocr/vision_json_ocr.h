#pragma once
/**
 * @file vision_json_ocr.h
 * @brief OCR engine that replays cached text-detection output
 *
 * For image "20161209.png" the fragments are read from
 * "<fragmentsDir>/20161209.json". Two layouts are accepted:
 *
 * Text-detection response (entry 0 is the full text and is skipped):
 * {
 *   "textAnnotations": [
 *     { "description": "..." },
 *     { "description": "Q1'17", "boundingPoly": { "vertices": [ {"x":..,"y":..}, ... ] } }
 *   ]
 * }
 *
 * Plain fragment list:
 * [ { "text": "Q1'17", "left": 10, "top": 500, "width": 40, "height": 12, "conf": 96.0 } ]
 */

#include "ocr/ocr_engine.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace eps_monitor {

class VisionJsonOcr : public OcrEngine {
public:
    explicit VisionJsonOcr(std::string fragmentsDir);

    std::vector<Fragment> recognize(const std::vector<uint8_t>& imageBytes,
                                    const std::string& imageName) override;

    std::string name() const override { return "json"; }

    /**
     * @brief Path of the cached output for an image name
     */
    std::string fragmentsPathFor(const std::string& imageName) const;

    /**
     * @brief Convert either accepted layout to fragments
     * @throws std::runtime_error when the document has neither layout
     */
    static std::vector<Fragment> parseFragments(const nlohmann::json& doc);

private:
    std::string m_fragmentsDir;
};

} // namespace eps_monitor
