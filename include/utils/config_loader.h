#pragma once
/**
 * @file config_loader.h
 * @brief Configuration file loading utilities
 */

#include "types.h"
#include <string>

namespace eps_monitor {

/**
 * @brief Load full pipeline configuration
 *
 * Missing sections and fields keep their defaults. A missing or malformed
 * file is logged and yields the built-in defaults.
 *
 * @param path Path to pipeline_config.json
 * @return Pipeline configuration
 */
PipelineConfig loadPipelineConfig(const std::string& path);

/**
 * @brief Load full pipeline configuration without logging
 *
 * Same fallback rules as loadPipelineConfig, but the reason for using the
 * defaults is returned in @p warning (empty when the file was read) so the
 * caller can report it after applying the configured log level.
 */
PipelineConfig loadPipelineConfig(const std::string& path, std::string& warning);

/**
 * @brief Parse configuration JSON text over the defaults
 * @param text JSON document
 * @param config Populated on success
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool parsePipelineConfig(const std::string& text, PipelineConfig& config, std::string& errorMessage);

/**
 * @brief Write a configuration as pretty-printed JSON
 *
 * Creates the parent directory if needed.
 *
 * @param path Destination file
 * @param config Configuration to write
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool savePipelineConfig(const std::string& path, const PipelineConfig& config, std::string& errorMessage);

} // namespace eps_monitor
