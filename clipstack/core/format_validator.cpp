/*
 * File:        format_validator.cpp
 * Module:      clipstack-core
 * Purpose:     Construction-time validation of input clips
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "format_validator.h"
#include "combine_errors.h"
#include "logging.h"
#include <fmt/format.h>

namespace clipstack {

const char* combine_mode_name(CombineMode mode) {
    switch (mode) {
        case CombineMode::Mean: return "Mean";
        case CombineMode::Median: return "Median";
    }
    return "Unknown";
}

bool is_format_supported(CombineMode mode, const PixelFormat& format) {
    if (format.sample_type == SampleType::Integer) {
        return format.bits_per_sample >= 8 && format.bits_per_sample <= 32;
    }

    switch (mode) {
        case CombineMode::Mean:
            return format.bits_per_sample == 16 || format.bits_per_sample == 32;
        case CombineMode::Median:
            return format.bits_per_sample == 32;
    }
    return false;
}

namespace {

// Name of the first attribute in which two formats differ, or nullptr
const char* format_difference(const PixelFormat& a, const PixelFormat& b) {
    if (a.sample_type != b.sample_type) return "sample type";
    if (a.bits_per_sample != b.bits_per_sample) return "bit depth";
    if (a.color_family != b.color_family) return "color family";
    if (a.subsampling_w != b.subsampling_w || a.subsampling_h != b.subsampling_h) return "subsampling";
    return nullptr;
}

} // anonymous namespace

ValidatedFormat validate_clips(const std::vector<VideoClipPtr>& clips, CombineMode mode) {
    if (clips.empty()) {
        throw InvalidArgumentError("There should be at least one clip as input");
    }

    for (size_t i = 0; i < clips.size(); ++i) {
        if (!clips[i]) {
            throw InvalidArgumentError(fmt::format("Input clip {} is null", i));
        }
        if (!clips[i]->video_info().is_constant()) {
            throw UnsupportedFormatError(fmt::format(
                "{}: input clip {} has variable format, resolution or frame rate, which is not supported",
                combine_mode_name(mode), i));
        }
    }

    const VideoInfo& reference = clips[0]->video_info();

    for (size_t i = 1; i < clips.size(); ++i) {
        const VideoInfo& info = clips[i]->video_info();

        if (const char* diff = format_difference(reference.format, info.format)) {
            throw FormatMismatchError(0, i, diff);
        }
        if (reference.width != info.width || reference.height != info.height) {
            throw FormatMismatchError(0, i, "dimensions");
        }
        // Compare rates as fractions so 50/2 and 25/1 are equal
        if (reference.fps_num * info.fps_den != info.fps_num * reference.fps_den) {
            throw FormatMismatchError(0, i, "frame rate");
        }
        if (reference.frame_count != info.frame_count) {
            throw FormatMismatchError(0, i, "frame count");
        }
    }

    const PixelFormat& format = reference.format;
    ValidatedFormat result;
    if (!is_format_supported(mode, format) || !representation_for(format, result.representation)) {
        throw UnsupportedFormatError(fmt::format(
            "{}: input depth {} not supported for sample type {}",
            combine_mode_name(mode), format.bits_per_sample, sample_type_name(format.sample_type)));
    }

    result.info = reference;
    result.clip_count = clips.size();

    CLIPSTACK_LOG_DEBUG("validate_clips: {} clip(s) of {} {}x{}, {} frames, mode {}",
                        clips.size(), format.name(), reference.width, reference.height,
                        reference.frame_count, combine_mode_name(mode));

    return result;
}

} // namespace clipstack
