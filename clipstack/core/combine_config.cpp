/*
 * File:        combine_config.cpp
 * Module:      clipstack-core
 * Purpose:     Immutable per-filter configuration shared by frame requests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "combine_config.h"
#include "combine_errors.h"
#include "logging.h"
#include <fmt/format.h>

namespace clipstack {

CombineConfigPtr make_combine_config(const std::vector<VideoClipPtr>& clips,
                                     CombineMode mode,
                                     int32_t preset,
                                     int32_t discard)
{
    if (mode == CombineMode::Median && (preset != 0 || discard != 0)) {
        throw InvalidArgumentError("Median: preset and discard are not supported");
    }
    if (preset != 0 && discard != 0) {
        throw InvalidArgumentError("Mean: preset and discard cannot be used together");
    }
    if (discard < 0) {
        throw InvalidArgumentError(fmt::format("Mean: discard must not be negative (got {})", discard));
    }

    auto config = std::make_shared<CombineConfig>();
    config->mode = mode;
    config->format = validate_clips(clips, mode);

    const size_t half = clips.size() / 2;
    if (discard > 0 && static_cast<size_t>(discard) >= half) {
        throw InvalidArgumentError(fmt::format(
            "Mean: discard must be less than half the number of clips ({} clips, discard {})",
            clips.size(), discard));
    }

    config->weights = WeightTable(preset);
    config->discard = static_cast<uint32_t>(discard);
    config->clips = clips;

    if (config->is_trimmed()) {
        CLIPSTACK_LOG_INFO("{}: {} clips, discarding {} low and {} high samples per pixel",
                           combine_mode_name(mode), clips.size(), discard, discard);
    } else if (mode == CombineMode::Mean) {
        const auto& m = config->weights.multipliers();
        CLIPSTACK_LOG_INFO("Mean: {} clips, preset {} (I {:.2f}, P {:.2f}, B {:.2f})",
                           clips.size(), preset, m[0], m[1], m[2]);
    } else {
        CLIPSTACK_LOG_INFO("Median: {} clips", clips.size());
    }

    return config;
}

} // namespace clipstack
