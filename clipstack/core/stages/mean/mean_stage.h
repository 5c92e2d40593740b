/*
 * File:        mean_stage.h
 * Module:      clipstack-core
 * Purpose:     Per-pixel weighted or trimmed mean of K clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "stage.h"
#include "stage_parameter.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace clipstack {

/**
 * @brief Mean stage - averages K clips pixel by pixel
 *
 * Every sample of the output frame is the mean of the samples at the same
 * position in the K input frames. Averaging several lossy encodes of one
 * source cancels much of their independent compression noise.
 *
 * Parameters:
 * - preset (0): picture-type weighting. 0 weighs every frame equally;
 *   1-3 weigh I and P frames above B frames using encoder quantizer ratios
 *   (1 = x264/x265 defaults, 2 = x264 grain tune, 3 = x265 grain tune).
 *   Other values fall back to equal weighting with a warning.
 * - discard (0): drop this many of the lowest and highest samples at each
 *   position before averaging. Must be less than half the clip count and
 *   cannot be combined with a preset.
 *
 * Supports integer samples of 8-32 bits and 16/32-bit float.
 */
class MeanStage : public CombineStage, public ParameterizedStage {
public:
    MeanStage();

    // CombineStage interface
    std::string version() const override { return "1.0"; }
    NodeTypeInfo get_node_type_info() const override {
        return NodeTypeInfo{
            "Mean",
            "Per-pixel Mean",
            "Average K clips pixel by pixel, optionally weighted by picture type or trimmed",
            1, UINT32_MAX
        };
    }

    VideoClipPtr execute(
        const std::vector<VideoClipPtr>& inputs,
        const std::map<std::string, ParameterValue>& parameters) override;

    // ParameterizedStage interface
    std::vector<ParameterDescriptor> get_parameter_descriptors() const override;
    std::map<std::string, ParameterValue> get_parameters() const override;
    bool set_parameters(const std::map<std::string, ParameterValue>& params) override;

private:
    int32_t m_preset;   // Weight preset (0 = equal)
    int32_t m_discard;  // Samples dropped from each end (0 = weighted mean)
};

} // namespace clipstack
