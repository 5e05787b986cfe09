/**
 * @file image_loader.cpp
 * @brief Image file reading and decoding with OpenCV
 */

#include "utils/image_loader.h"

#include <opencv2/imgcodecs.hpp>

#include <fstream>
#include <iterator>

namespace eps_monitor {

bool readFileBytes(const std::string& path, std::vector<uint8_t>& bytes, std::string& errorMessage) {
    errorMessage.clear();
    bytes.clear();

    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        errorMessage = "Cannot open file: " + path;
        return false;
    }

    bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        errorMessage = "Error reading file: " + path;
        bytes.clear();
        return false;
    }
    return true;
}

cv::Mat decodeImage(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return cv::Mat();
    }
    return cv::imdecode(bytes, cv::IMREAD_COLOR);
}

} // namespace eps_monitor
