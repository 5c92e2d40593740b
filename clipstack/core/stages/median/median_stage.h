/*
 * File:        median_stage.h
 * Module:      clipstack-core
 * Purpose:     Per-pixel median of K clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "stage.h"
#include "stage_parameter.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace clipstack {

/**
 * @brief Median stage - per-pixel median of K clips
 *
 * With an even clip count the two middle samples are averaged.
 * Supports integer samples of 8-32 bits and 32-bit float. Takes no
 * parameters.
 */
class MedianStage : public CombineStage, public ParameterizedStage {
public:
    MedianStage() = default;

    std::string version() const override { return "1.0"; }
    NodeTypeInfo get_node_type_info() const override {
        return NodeTypeInfo{
            "Median",
            "Per-pixel Median",
            "Median of K clips pixel by pixel",
            1, UINT32_MAX
        };
    }

    VideoClipPtr execute(
        const std::vector<VideoClipPtr>& inputs,
        const std::map<std::string, ParameterValue>& parameters) override;

    std::vector<ParameterDescriptor> get_parameter_descriptors() const override { return {}; }
    std::map<std::string, ParameterValue> get_parameters() const override { return {}; }
    bool set_parameters(const std::map<std::string, ParameterValue>& params) override;
};

} // namespace clipstack
