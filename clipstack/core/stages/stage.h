/*
 * File:        stage.h
 * Module:      clipstack-core/stages
 * Purpose:     Base interface for all combine stages
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "../include/combine_errors.h"
#include "../include/node_type.h"
#include "../include/stage_parameter.h"
#include "../include/video_clip.h"
#include <fmt/format.h>
#include <memory>
#include <vector>
#include <map>
#include <string>

namespace clipstack {

/**
 * @brief Base interface for all combine stages
 *
 * A stage turns K input clips plus parameters into one output clip.
 * Stages hold no per-frame state; the clip they return produces frames
 * on demand.
 */
class CombineStage {
public:
    virtual ~CombineStage() = default;

    /**
     * @brief Get stage version string
     *
     * Recorded in the provenance of every clip the stage produces.
     */
    virtual std::string version() const = 0;

    /**
     * @brief Get node type information for listing and validation
     */
    virtual NodeTypeInfo get_node_type_info() const = 0;

    /**
     * @brief Build the output clip
     *
     * @param inputs Input clips (clip 0 is the format reference)
     * @param parameters Stage parameters, applied before building
     * @return Output clip with the inputs' VideoInfo
     *
     * @throws InvalidArgumentError if a parameter or the input count is rejected
     * @throws FormatMismatchError, UnsupportedFormatError if the inputs cannot be combined
     */
    virtual VideoClipPtr execute(
        const std::vector<VideoClipPtr>& inputs,
        const std::map<std::string, ParameterValue>& parameters
    ) = 0;

protected:
    /// Throw InvalidArgumentError unless get_node_type_info() accepts inputs.size() clips
    void check_input_count(const std::vector<VideoClipPtr>& inputs) const {
        const NodeTypeInfo info = get_node_type_info();
        if (!info.accepts_inputs(inputs.size())) {
            throw InvalidArgumentError(fmt::format(
                "{}: {} input clip(s) given, stage accepts {} to {}",
                info.stage_name, inputs.size(), info.min_inputs, info.max_inputs));
        }
    }
};

/**
 * @brief Shared pointer to a stage
 */
using CombineStagePtr = std::shared_ptr<CombineStage>;

} // namespace clipstack
