/*
 * File:        pixel_format.h
 * Module:      clipstack-core
 * Purpose:     Pixel format, clip geometry and sample representation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "half_float.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace clipstack {

/**
 * @brief Numeric domain of a sample
 */
enum class SampleType {
    Integer,
    Float
};

/**
 * @brief Colour family of a format
 */
enum class ColorFamily {
    Gray,
    RGB,
    YUV,
    YCoCg
};

/**
 * @brief Description of how samples are laid out in a frame
 *
 * Subsampling is given as log2 factors and applies to planes 1 and 2 only.
 * Gray formats have a single plane, all others have three.
 */
struct PixelFormat {
    SampleType sample_type = SampleType::Integer;
    uint32_t bits_per_sample = 0;
    ColorFamily color_family = ColorFamily::Gray;
    uint32_t subsampling_w = 0;
    uint32_t subsampling_h = 0;

    uint32_t plane_count() const { return color_family == ColorFamily::Gray ? 1 : 3; }

    /// Storage size of one sample: 8 -> 1, 9..16 -> 2, 17..32 -> 4
    uint32_t bytes_per_sample() const {
        if (bits_per_sample <= 8) return 1;
        if (bits_per_sample <= 16) return 2;
        return 4;
    }

    bool is_defined() const { return bits_per_sample > 0; }

    /// Human-readable name, e.g. "YUV420P10" or "GrayS"
    std::string name() const;

    bool operator==(const PixelFormat& other) const {
        return sample_type == other.sample_type &&
               bits_per_sample == other.bits_per_sample &&
               color_family == other.color_family &&
               subsampling_w == other.subsampling_w &&
               subsampling_h == other.subsampling_h;
    }
    bool operator!=(const PixelFormat& other) const { return !(*this == other); }
};

/**
 * @brief Clip-level properties shared by every frame of a clip
 */
struct VideoInfo {
    PixelFormat format;
    uint32_t width = 0;
    uint32_t height = 0;
    int64_t fps_num = 0;
    int64_t fps_den = 0;
    uint64_t frame_count = 0;

    /// True when format, dimensions and frame rate are all fixed
    bool is_constant() const {
        return format.is_defined() && width > 0 && height > 0 && fps_den > 0;
    }

    /// Width of a plane, accounting for chroma subsampling
    uint32_t plane_width(uint32_t plane) const {
        return plane == 0 ? width : (width >> format.subsampling_w);
    }

    /// Height of a plane, accounting for chroma subsampling
    uint32_t plane_height(uint32_t plane) const {
        return plane == 0 ? height : (height >> format.subsampling_h);
    }
};

const char* sample_type_name(SampleType type);
const char* color_family_name(ColorFamily family);

// ============================================================================
// Sample representations
// ============================================================================

/**
 * @brief Tag for one concrete sample storage type
 */
template <typename T>
struct SampleTag {
    using storage_type = T;
};

/**
 * @brief Closed set of sample representations the engine supports
 *
 * Selected once from a PixelFormat; kernels are instantiated per
 * alternative with std::visit.
 */
using SampleRepresentation = std::variant<
    SampleTag<uint8_t>,     // Integer, 8 bits
    SampleTag<uint16_t>,    // Integer, 9-16 bits
    SampleTag<uint32_t>,    // Integer, 17-32 bits
    SampleTag<Half>,        // Float, 16 bits
    SampleTag<float>        // Float, 32 bits
>;

/**
 * @brief Map a format to its sample representation
 *
 * @return false if the sample type / bit depth pair has no representation
 */
bool representation_for(const PixelFormat& format, SampleRepresentation& out);

} // namespace clipstack
