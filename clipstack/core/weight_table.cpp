/*
 * File:        weight_table.cpp
 * Module:      clipstack-core
 * Purpose:     Picture-type weighting presets for Mean
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "weight_table.h"
#include "logging.h"

namespace clipstack {

bool is_known_preset(int32_t preset) {
    return preset >= static_cast<int32_t>(WeightPreset::Balanced) &&
           preset <= static_cast<int32_t>(WeightPreset::X265Grain);
}

WeightMultipliers weights_for(int32_t preset) {
    switch (preset) {
        case static_cast<int32_t>(WeightPreset::X26xDefault):
            return {1.82, 1.30, 1.00};
        case static_cast<int32_t>(WeightPreset::X264Grain):
            return {1.21, 1.10, 1.00};
        case static_cast<int32_t>(WeightPreset::X265Grain):
            return {1.10, 1.00, 1.00};
        default:
            return {1.00, 1.00, 1.00};
    }
}

std::optional<PictureType> picture_type_of(const VideoFrame& frame) {
    auto prop = frame.get_property(PICTURE_TYPE_PROPERTY);
    if (!prop) {
        return std::nullopt;
    }

    const auto* str = std::get_if<std::string>(&*prop);
    if (!str || str->empty()) {
        return std::nullopt;
    }

    switch ((*str)[0]) {
        case 'I':
        case 'i':
            return PictureType::Intra;
        case 'P':
        case 'p':
            return PictureType::Predicted;
        case 'B':
            return PictureType::Bidirectional;
        default:
            return std::nullopt;
    }
}

WeightTable::WeightTable(int32_t preset)
    : preset_(preset)
    , multipliers_(weights_for(preset))
{
    if (!is_known_preset(preset)) {
        CLIPSTACK_LOG_WARN("WeightTable: unknown preset {} (only 0..3 supported), using equal weighting", preset);
    }
}

bool WeightTable::is_uniform() const {
    return multipliers_[0] == multipliers_[1] && multipliers_[1] == multipliers_[2];
}

double WeightTable::multiplier_for(std::optional<PictureType> type) const {
    if (!type) {
        return multipliers_[static_cast<size_t>(PictureType::Intra)];
    }
    return multipliers_[static_cast<size_t>(*type)];
}

std::vector<double> WeightTable::normalized_weights(const std::vector<std::optional<PictureType>>& types) const {
    std::vector<double> weights;
    weights.reserve(types.size());

    double sum = 0.0;
    for (const auto& type : types) {
        double w = multiplier_for(type);
        weights.push_back(w);
        sum += w;
    }

    if (sum <= 0.0) {
        return weights;
    }

    // Division done once; only multiplication per clip
    const double reciprocal = 1.0 / sum;
    for (auto& w : weights) {
        w *= reciprocal;
    }
    return weights;
}

} // namespace clipstack
