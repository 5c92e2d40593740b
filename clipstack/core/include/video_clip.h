/*
 * File:        video_clip.h
 * Module:      clipstack-core
 * Purpose:     Video clip interface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "artifact.h"
#include "pixel_format.h"
#include "video_frame.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace clipstack {

/**
 * @brief Abstract interface for a fixed-format sequence of frames
 *
 * A VideoClip provides read-only, pull-based access to frames.
 * Concrete implementations may be:
 * - Frames supplied by a host application
 * - In-memory frames (MemoryClip)
 * - Frames combined on demand from other clips (CombinedClip)
 *
 * Implementations must allow get_frame() to be called concurrently
 * from multiple threads.
 */
class VideoClip : public Artifact {
public:
    virtual ~VideoClip() = default;

    /// Format, geometry, frame rate and length (identical for every frame)
    virtual const VideoInfo& video_info() const = 0;

    /**
     * @brief Fetch a frame
     *
     * @param n Frame index (0-based)
     * @return The frame, or nullptr if it could not be produced
     */
    virtual VideoFramePtr get_frame(uint64_t n) const = 0;

    uint64_t frame_count() const { return video_info().frame_count; }

    std::string type_name() const override { return "VideoClip"; }

protected:
    VideoClip(ArtifactID id, Provenance prov)
        : Artifact(std::move(id), std::move(prov)) {}
};

using VideoClipPtr = std::shared_ptr<const VideoClip>;

/**
 * @brief Clip backed by a vector of frames held in memory
 *
 * Frames are appended while building the clip; the frame count in
 * video_info() follows the number of frames added.
 */
class MemoryClip : public VideoClip {
public:
    MemoryClip(ArtifactID id, const PixelFormat& format, uint32_t width, uint32_t height,
               int64_t fps_num = 25, int64_t fps_den = 1);

    const VideoInfo& video_info() const override { return info_; }
    VideoFramePtr get_frame(uint64_t n) const override;

    /// Append a frame (must match the clip's format and dimensions)
    void add_frame(std::shared_ptr<VideoFrame> frame);

    /// Allocate a new frame of the clip's format, append it and return it for filling
    std::shared_ptr<VideoFrame> add_blank_frame();

    /// Override the reported length (for clips whose frames are sparse or synthetic)
    void set_frame_count(uint64_t count) { info_.frame_count = count; }

    std::string type_name() const override { return "MemoryClip"; }

private:
    VideoInfo info_;
    std::vector<std::shared_ptr<const VideoFrame>> frames_;
};

} // namespace clipstack
