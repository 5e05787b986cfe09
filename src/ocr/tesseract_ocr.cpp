/**
 * @file tesseract_ocr.cpp
 * @brief Word-level text detection with Tesseract
 */

#include "ocr/tesseract_ocr.h"
#include "utils/image_loader.h"
#include "utils/logger.h"

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace eps_monitor {

TesseractOcr::TesseractOcr(const std::string& tessdataPath, const std::string& language)
    : m_api(std::make_unique<tesseract::TessBaseAPI>()) {
    const char* dataPath = tessdataPath.empty() ? nullptr : tessdataPath.c_str();
    if (m_api->Init(dataPath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        throw std::runtime_error("Failed to initialize Tesseract (language '" + language + "')");
    }
    // Sparse text: chart labels are scattered, not laid out in lines
    m_api->SetPageSegMode(tesseract::PSM_SPARSE_TEXT);
}

TesseractOcr::~TesseractOcr() {
    if (m_api) {
        m_api->End();
    }
}

std::vector<Fragment> TesseractOcr::recognize(const std::vector<uint8_t>& imageBytes,
                                              const std::string& imageName) {
    cv::Mat image = decodeImage(imageBytes);
    if (image.empty()) {
        throw std::runtime_error("Cannot decode image for OCR: " + imageName);
    }

    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else {
        cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    }

    m_api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    if (m_api->Recognize(nullptr) != 0) {
        throw std::runtime_error("Tesseract recognition failed: " + imageName);
    }

    std::vector<Fragment> fragments;
    std::unique_ptr<tesseract::ResultIterator> ri(m_api->GetIterator());
    if (!ri) {
        return fragments;
    }

    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    do {
        std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
        if (!word || *word.get() == '\0') continue;

        int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
        if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) continue;

        Fragment f;
        f.text = word.get();
        f.left = x1;
        f.top = y1;
        f.width = x2 - x1;
        f.height = y2 - y1;
        f.confidence = ri->Confidence(level);
        fragments.push_back(std::move(f));
    } while (ri->Next(level));

    logDebug("Tesseract found " + std::to_string(fragments.size()) + " words in " + imageName);
    return fragments;
}

} // namespace eps_monitor
