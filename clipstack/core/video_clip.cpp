/*
 * File:        video_clip.cpp
 * Module:      clipstack-core
 * Purpose:     In-memory clip implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "video_clip.h"
#include "logging.h"
#include <stdexcept>

namespace clipstack {

MemoryClip::MemoryClip(ArtifactID id, const PixelFormat& format, uint32_t width, uint32_t height,
                       int64_t fps_num, int64_t fps_den)
    : VideoClip(std::move(id), Provenance{})
{
    info_.format = format;
    info_.width = width;
    info_.height = height;
    info_.fps_num = fps_num;
    info_.fps_den = fps_den;
    info_.frame_count = 0;
}

VideoFramePtr MemoryClip::get_frame(uint64_t n) const {
    if (n >= frames_.size()) {
        CLIPSTACK_LOG_DEBUG("MemoryClip '{}': frame {} not available ({} frames held)",
                            id().value(), n, frames_.size());
        return nullptr;
    }
    return frames_[n];
}

void MemoryClip::add_frame(std::shared_ptr<VideoFrame> frame) {
    if (!frame) {
        throw std::invalid_argument("MemoryClip::add_frame: null frame");
    }
    if (frame->format() != info_.format || frame->width() != info_.width || frame->height() != info_.height) {
        throw std::invalid_argument("MemoryClip::add_frame: frame does not match clip format");
    }
    frames_.push_back(std::move(frame));
    info_.frame_count = frames_.size();
}

std::shared_ptr<VideoFrame> MemoryClip::add_blank_frame() {
    auto frame = VideoFrame::create(info_.format, info_.width, info_.height);
    add_frame(frame);
    return frame;
}

} // namespace clipstack
