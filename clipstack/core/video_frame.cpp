/*
 * File:        video_frame.cpp
 * Module:      clipstack-core
 * Purpose:     Planar video frame with properties
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "video_frame.h"
#include <stdexcept>

namespace clipstack {

namespace {
constexpr size_t STRIDE_ALIGNMENT = 32;
}

VideoFrame::VideoFrame(const PixelFormat& format, uint32_t width, uint32_t height)
    : format_(format)
    , width_(width)
    , height_(height)
{
    if (!format.is_defined() || width == 0 || height == 0) {
        throw std::invalid_argument("VideoFrame requires a defined format and non-zero dimensions");
    }

    const uint32_t planes = format.plane_count();
    strides_.reserve(planes);
    planes_.reserve(planes);

    for (uint32_t p = 0; p < planes; ++p) {
        size_t row_bytes = static_cast<size_t>(plane_width(p)) * format.bytes_per_sample();
        size_t stride = (row_bytes + STRIDE_ALIGNMENT - 1) & ~(STRIDE_ALIGNMENT - 1);
        strides_.push_back(stride);
        planes_.emplace_back(stride * plane_height(p), 0);
    }
}

uint32_t VideoFrame::plane_width(uint32_t plane) const {
    return plane == 0 ? width_ : (width_ >> format_.subsampling_w);
}

uint32_t VideoFrame::plane_height(uint32_t plane) const {
    return plane == 0 ? height_ : (height_ >> format_.subsampling_h);
}

std::optional<FramePropertyValue> VideoFrame::get_property(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace clipstack
