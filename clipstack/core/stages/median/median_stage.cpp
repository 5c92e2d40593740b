/*
 * File:        median_stage.cpp
 * Module:      clipstack-core
 * Purpose:     Per-pixel median of K clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include <median_stage.h>
#include <stage_registry.h>
#include <combine_config.h>
#include <combine_errors.h>
#include <combined_clip.h>
#include <logging.h>

namespace clipstack {

// Register this stage with the registry
CLIPSTACK_REGISTER_STAGE(MedianStage)

VideoClipPtr MedianStage::execute(
    const std::vector<VideoClipPtr>& inputs,
    const std::map<std::string, ParameterValue>& parameters)
{
    check_input_count(inputs);

    if (!set_parameters(parameters)) {
        throw InvalidArgumentError("Median: invalid parameters");
    }

    CLIPSTACK_LOG_DEBUG("MedianStage: executing on {} input(s)", inputs.size());

    auto config = make_combine_config(inputs, CombineMode::Median);
    return make_combined_clip(std::move(config), get_node_type_info().stage_name, version(), {});
}

bool MedianStage::set_parameters(const std::map<std::string, ParameterValue>& params)
{
    std::string error;
    if (!parameter_util::validate(get_parameter_descriptors(), params, error)) {
        CLIPSTACK_LOG_WARN("MedianStage: {}", error);
        return false;
    }
    return true;
}

} // namespace clipstack
