#pragma once
/**
 * @file tesseract_ocr.h
 * @brief Word-level text detection with Tesseract
 */

#include "ocr/ocr_engine.h"

#include <memory>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace eps_monitor {

class TesseractOcr : public OcrEngine {
public:
    /**
     * @param tessdataPath Directory containing traineddata (empty = default)
     * @param language Language code
     * @throws std::runtime_error if Tesseract fails to initialize
     */
    TesseractOcr(const std::string& tessdataPath, const std::string& language);
    ~TesseractOcr() override;

    TesseractOcr(const TesseractOcr&) = delete;
    TesseractOcr& operator=(const TesseractOcr&) = delete;

    std::vector<Fragment> recognize(const std::vector<uint8_t>& imageBytes,
                                    const std::string& imageName) override;

    std::string name() const override { return "tesseract"; }

private:
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
};

} // namespace eps_monitor
