/*
 * File:        mean_stage.cpp
 * Module:      clipstack-core
 * Purpose:     Per-pixel weighted or trimmed mean of K clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include <mean_stage.h>
#include <stage_registry.h>
#include <combine_config.h>
#include <combine_errors.h>
#include <combined_clip.h>
#include <logging.h>

namespace clipstack {

// Register this stage with the registry
CLIPSTACK_REGISTER_STAGE(MeanStage)

MeanStage::MeanStage()
    : m_preset(0)
    , m_discard(0)
{
}

VideoClipPtr MeanStage::execute(
    const std::vector<VideoClipPtr>& inputs,
    const std::map<std::string, ParameterValue>& parameters)
{
    check_input_count(inputs);

    if (!parameters.empty() && !set_parameters(parameters)) {
        throw InvalidArgumentError("Mean: invalid parameters");
    }

    CLIPSTACK_LOG_DEBUG("MeanStage: executing on {} input(s), preset={}, discard={}",
                        inputs.size(), m_preset, m_discard);

    auto config = make_combine_config(inputs, CombineMode::Mean, m_preset, m_discard);

    std::map<std::string, std::string> prov_params;
    for (const auto& [key, value] : get_parameters()) {
        prov_params[key] = parameter_util::value_to_string(value);
    }

    return make_combined_clip(std::move(config), get_node_type_info().stage_name, version(), prov_params);
}

std::vector<ParameterDescriptor> MeanStage::get_parameter_descriptors() const
{
    std::vector<ParameterDescriptor> descriptors;

    ParameterDescriptor preset_desc;
    preset_desc.name = "preset";
    preset_desc.display_name = "Weight Preset";
    preset_desc.description = "Picture-type weighting (I, P, B multipliers)\n"
                              "0 = equal [1.00, 1.00, 1.00]\n"
                              "1 = x264/x265 defaults [1.82, 1.30, 1.00]\n"
                              "2 = x264 grain tune [1.21, 1.10, 1.00]\n"
                              "3 = x265 grain tune [1.10, 1.00, 1.00]";
    preset_desc.type = ParameterType::INT32;
    descriptors.push_back(preset_desc);

    ParameterDescriptor discard_desc;
    discard_desc.name = "discard";
    discard_desc.display_name = "Discard";
    discard_desc.description = "Number of lowest and highest samples dropped at each position "
                               "before averaging (must be less than half the clip count)";
    discard_desc.type = ParameterType::INT32;
    discard_desc.constraints.min_value = static_cast<int32_t>(0);
    descriptors.push_back(discard_desc);

    return descriptors;
}

std::map<std::string, ParameterValue> MeanStage::get_parameters() const
{
    return {
        {"preset", m_preset},
        {"discard", m_discard}
    };
}

bool MeanStage::set_parameters(const std::map<std::string, ParameterValue>& params)
{
    std::string error;
    if (!parameter_util::validate(get_parameter_descriptors(), params, error)) {
        CLIPSTACK_LOG_WARN("MeanStage: {}", error);
        return false;
    }

    int32_t preset = m_preset;
    int32_t discard = m_discard;
    if (auto it = params.find("preset"); it != params.end()) {
        preset = std::get<int32_t>(it->second);
    }
    if (auto it = params.find("discard"); it != params.end()) {
        discard = std::get<int32_t>(it->second);
    }

    if (preset != 0 && discard != 0) {
        CLIPSTACK_LOG_WARN("MeanStage: preset {} and discard {} cannot be used together", preset, discard);
        return false;
    }

    m_preset = preset;
    m_discard = discard;
    return true;
}

} // namespace clipstack
