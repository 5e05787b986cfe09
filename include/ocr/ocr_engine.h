#pragma once
/**
 * @file ocr_engine.h
 * @brief Text detection boundary: image bytes in, text fragments out
 */

#include "types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace eps_monitor {

/**
 * @brief Abstract OCR engine
 *
 * Implementations throw std::runtime_error on engine failure; an empty
 * result means the image has no text.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @param imageBytes Encoded image (PNG/JPEG)
     * @param imageName Filename of the image, used by engines that replay cached output
     * @return Text fragments with bounding boxes, in no particular order
     */
    virtual std::vector<Fragment> recognize(const std::vector<uint8_t>& imageBytes,
                                            const std::string& imageName) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Create the engine selected by config.backend
 * @throws std::runtime_error for an unknown or unavailable backend
 */
std::unique_ptr<OcrEngine> createOcrEngine(const OcrConfig& config);

} // namespace eps_monitor
