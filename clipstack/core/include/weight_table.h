/*
 * File:        weight_table.h
 * Module:      clipstack-core
 * Purpose:     Picture-type weighting presets for Mean
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "video_frame.h"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace clipstack {

/**
 * @brief Encoder picture type of a frame
 */
enum class PictureType {
    Intra = 0,
    Predicted = 1,
    Bidirectional = 2
};

/// Multipliers in the order {Intra, Predicted, Bidirectional}
using WeightMultipliers = std::array<double, 3>;

/**
 * @brief Named weighting presets
 *
 * The ratios invert the encoder's quantizer offsets between picture types,
 * so that a frame coded with a finer quantizer contributes more.
 */
enum class WeightPreset : int32_t {
    Balanced = 0,    // [1.00, 1.00, 1.00]
    X26xDefault = 1, // x264/x265 defaults (ipratio 1.4, pbratio 1.3)
    X264Grain = 2,   // x264 --tune grain (ipratio 1.1, pbratio 1.1)
    X265Grain = 3    // x265 --tune grain (ipratio 1.1, pbratio 1.0)
};

/// True for preset values 0..3
bool is_known_preset(int32_t preset);

/**
 * @brief Multipliers for a preset
 *
 * Unknown presets return the balanced vector.
 */
WeightMultipliers weights_for(int32_t preset);

/**
 * @brief Read a frame's picture type from its _PictType property
 *
 * @return nullopt if the property is absent or not I/i, P/p or B
 */
std::optional<PictureType> picture_type_of(const VideoFrame& frame);

/**
 * @brief Immutable weight table built once per Mean filter
 */
class WeightTable {
public:
    explicit WeightTable(int32_t preset = 0);

    int32_t preset() const { return preset_; }
    const WeightMultipliers& multipliers() const { return multipliers_; }

    /// True when every picture type has the same multiplier
    bool is_uniform() const;

    /// Multiplier for one frame; frames without a picture type weigh as Intra
    double multiplier_for(std::optional<PictureType> type) const;

    /**
     * @brief Per-clip weights for one output frame, normalized to sum to 1
     *
     * @param types Picture type of each input clip's frame, in clip order
     */
    std::vector<double> normalized_weights(const std::vector<std::optional<PictureType>>& types) const;

private:
    int32_t preset_;
    WeightMultipliers multipliers_;
};

} // namespace clipstack
