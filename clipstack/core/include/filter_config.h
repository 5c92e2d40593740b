/*
 * File:        filter_config.h
 * Module:      clipstack-core
 * Purpose:     YAML filter description
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "frame_scheduler.h"
#include "stage_parameter.h"
#include "video_clip.h"
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipstack {

/**
 * @brief Malformed or invalid filter description
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct LoggingConfig {
    std::string level = "info";   // trace|debug|info|warn|error|critical|off
    std::string file;             // Empty = console only
};

struct SchedulerConfig {
    int32_t threads = 0;          // 0 = hardware concurrency
};

/**
 * @brief A filter description
 *
 * Example:
 * ```yaml
 * logging:
 *   level: debug
 * filter:
 *   stage: Mean
 *   parameters:
 *     preset: { type: int32, value: 1 }
 * scheduler:
 *   threads: 4
 * ```
 */
struct FilterConfig {
    LoggingConfig logging;
    std::string stage_name;
    std::map<std::string, ParameterValue> parameters;
    SchedulerConfig scheduler;
};

/**
 * @brief Parse a filter description from YAML text
 * @throws ConfigError if the document is malformed or incomplete
 */
FilterConfig parse_filter_config(const std::string& text);

/**
 * @brief Load a filter description from a YAML file
 * @throws ConfigError if the file cannot be read or is malformed
 */
FilterConfig load_filter_config(const std::string& filename);

/// Serialize a filter description to YAML
std::string filter_config_to_yaml(const FilterConfig& config);

/// Reconfigure the library logger from the logging section
void apply_logging(const FilterConfig& config);

/**
 * @brief Create the configured stage and run it on the clips
 *
 * @throws StageRegistryError if the stage name is unknown
 * @throws CombineError subclasses if the clips or parameters are rejected
 */
VideoClipPtr build_filter(const FilterConfig& config, const std::vector<VideoClipPtr>& clips);

/**
 * @brief Create a scheduler for a clip returned by build_filter()
 *
 * @throws ConfigError if the clip was not produced by a combine stage
 */
std::unique_ptr<FrameScheduler> build_scheduler(const FilterConfig& config, const VideoClipPtr& filter);

} // namespace clipstack
