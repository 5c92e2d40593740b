/*
 * File:        format_validator.h
 * Module:      clipstack-core
 * Purpose:     Construction-time validation of input clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "pixel_format.h"
#include "video_clip.h"
#include <vector>

namespace clipstack {

/**
 * @brief How the K samples at a position are combined
 */
enum class CombineMode {
    Mean,
    Median
};

const char* combine_mode_name(CombineMode mode);

/**
 * @brief Result of a successful validation
 *
 * Immutable once returned; shared by every frame request of the filter.
 */
struct ValidatedFormat {
    VideoInfo info;                       // Common to all inputs and the output
    SampleRepresentation representation;  // Storage type used by the kernels
    size_t clip_count = 0;
};

/**
 * @brief Check whether a mode supports a sample type / bit depth pair
 *
 * Mean: integer 8-32 bits, float 16 and 32 bits.
 * Median: integer 8-32 bits, float 32 bits.
 */
bool is_format_supported(CombineMode mode, const PixelFormat& format);

/**
 * @brief Validate the input clips of a combine
 *
 * Clip 0 is the reference; every other clip must match its pixel format,
 * dimensions, frame rate and frame count.
 *
 * @throws InvalidArgumentError if clips is empty or contains a null clip
 * @throws UnsupportedFormatError if a clip has variable properties or the
 *         mode does not support the sample representation
 * @throws FormatMismatchError naming the first conflicting pair and attribute
 */
ValidatedFormat validate_clips(const std::vector<VideoClipPtr>& clips, CombineMode mode);

} // namespace clipstack
