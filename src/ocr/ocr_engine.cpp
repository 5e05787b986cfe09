/**
 * @file ocr_engine.cpp
 * @brief OCR backend selection
 */

#include "ocr/ocr_engine.h"
#include "ocr/vision_json_ocr.h"

#if defined(EM_USE_TESSERACT)
#include "ocr/tesseract_ocr.h"
#endif

#include <stdexcept>

namespace eps_monitor {

std::unique_ptr<OcrEngine> createOcrEngine(const OcrConfig& config) {
    if (config.backend == "json") {
        return std::make_unique<VisionJsonOcr>(config.fragmentsDir);
    }
    if (config.backend == "tesseract") {
#if defined(EM_USE_TESSERACT)
        return std::make_unique<TesseractOcr>(config.tessdataPath, config.language);
#else
        throw std::runtime_error("Tesseract backend not available in this build");
#endif
    }
    throw std::runtime_error("Unknown OCR backend: " + config.backend);
}

} // namespace eps_monitor
