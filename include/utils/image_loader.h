#pragma once
/**
 * @file image_loader.h
 * @brief Image file reading and decoding
 */

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace eps_monitor {

/**
 * @brief Read a whole file into memory
 * @param path File path
 * @param bytes Receives the file contents
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool readFileBytes(const std::string& path, std::vector<uint8_t>& bytes, std::string& errorMessage);

/**
 * @brief Decode PNG/JPEG/BMP bytes to a BGR image
 * @return Decoded image, empty on failure
 */
cv::Mat decodeImage(const std::vector<uint8_t>& bytes);

} // namespace eps_monitor
