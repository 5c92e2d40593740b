/*
 * File:        pixel_format.cpp
 * Module:      clipstack-core
 * Purpose:     Pixel format helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "pixel_format.h"
#include <fmt/format.h>

namespace clipstack {

const char* sample_type_name(SampleType type) {
    switch (type) {
        case SampleType::Integer: return "integer";
        case SampleType::Float: return "float";
    }
    return "unknown";
}

const char* color_family_name(ColorFamily family) {
    switch (family) {
        case ColorFamily::Gray: return "Gray";
        case ColorFamily::RGB: return "RGB";
        case ColorFamily::YUV: return "YUV";
        case ColorFamily::YCoCg: return "YCoCg";
    }
    return "Unknown";
}

std::string PixelFormat::name() const {
    std::string depth;
    if (sample_type == SampleType::Float) {
        depth = bits_per_sample == 16 ? "H" : "S";
    } else {
        depth = std::to_string(bits_per_sample);
    }

    switch (color_family) {
        case ColorFamily::Gray:
            return fmt::format("Gray{}", depth);
        case ColorFamily::RGB:
            return fmt::format("RGB{}", depth);
        case ColorFamily::YUV:
        case ColorFamily::YCoCg: {
            // Common names for the usual subsampling pairs
            std::string ss;
            if (subsampling_w == 1 && subsampling_h == 1) ss = "420";
            else if (subsampling_w == 1 && subsampling_h == 0) ss = "422";
            else if (subsampling_w == 0 && subsampling_h == 0) ss = "444";
            else if (subsampling_w == 2 && subsampling_h == 2) ss = "410";
            else if (subsampling_w == 2 && subsampling_h == 0) ss = "411";
            else if (subsampling_w == 0 && subsampling_h == 1) ss = "440";
            else ss = fmt::format("ss{}{}", subsampling_w, subsampling_h);
            return fmt::format("{}{}P{}", color_family_name(color_family), ss, depth);
        }
    }
    return "Unknown";
}

bool representation_for(const PixelFormat& format, SampleRepresentation& out) {
    if (format.sample_type == SampleType::Integer) {
        if (format.bits_per_sample < 8 || format.bits_per_sample > 32) {
            return false;
        }
        switch (format.bytes_per_sample()) {
            case 1: out = SampleTag<uint8_t>{}; return true;
            case 2: out = SampleTag<uint16_t>{}; return true;
            default: out = SampleTag<uint32_t>{}; return true;
        }
    }

    if (format.bits_per_sample == 16) {
        out = SampleTag<Half>{};
        return true;
    }
    if (format.bits_per_sample == 32) {
        out = SampleTag<float>{};
        return true;
    }
    return false;
}

} // namespace clipstack
