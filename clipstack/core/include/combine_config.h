/*
 * File:        combine_config.h
 * Module:      clipstack-core
 * Purpose:     Immutable per-filter configuration shared by frame requests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "format_validator.h"
#include "video_clip.h"
#include "weight_table.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace clipstack {

/**
 * @brief Everything decided at construction of a combine
 *
 * Built once, never modified, and shared by every frame request.
 */
struct CombineConfig {
    CombineMode mode = CombineMode::Mean;
    ValidatedFormat format;
    WeightTable weights;
    uint32_t discard = 0;  // Mean only; 0 = weighted mean
    std::vector<VideoClipPtr> clips;

    bool is_trimmed() const { return mode == CombineMode::Mean && discard > 0; }
};

using CombineConfigPtr = std::shared_ptr<const CombineConfig>;

/**
 * @brief Validate inputs and parameters and build the configuration
 *
 * @param clips Input clips (clip 0 is the format reference)
 * @param mode Mean or Median
 * @param preset Weight preset (Mean only; unknown values fall back to equal weights)
 * @param discard Samples dropped from each end (Mean only)
 *
 * @throws InvalidArgumentError for negative discard, discard >= K/2,
 *         or preset combined with discard
 * @throws FormatMismatchError, UnsupportedFormatError from validate_clips()
 */
CombineConfigPtr make_combine_config(const std::vector<VideoClipPtr>& clips,
                                     CombineMode mode,
                                     int32_t preset = 0,
                                     int32_t discard = 0);

} // namespace clipstack
