/*
 * File:        combined_clip.h
 * Module:      clipstack-core
 * Purpose:     Output clip whose frames are combined on demand
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "frame_combiner.h"
#include "video_clip.h"
#include <map>
#include <memory>
#include <string>

namespace clipstack {

/**
 * @brief Clip produced by a Mean or Median stage
 *
 * Reports the inputs' VideoInfo unchanged. Frames are not cached; each
 * get_frame() call runs the combiner for that index.
 */
class CombinedClip : public VideoClip {
public:
    CombinedClip(std::shared_ptr<const FrameCombiner> combiner, ArtifactID id, Provenance prov);

    const VideoInfo& video_info() const override { return combiner_->video_info(); }

    /**
     * @brief Combine frame n
     *
     * Failures are logged and reported as nullptr, like any other clip.
     * Use combiner()->combine() to receive the exception instead.
     */
    VideoFramePtr get_frame(uint64_t n) const override;

    const std::shared_ptr<const FrameCombiner>& combiner() const { return combiner_; }

    std::string type_name() const override { return "CombinedClip"; }

private:
    std::shared_ptr<const FrameCombiner> combiner_;
};

/**
 * @brief Wrap a validated configuration in a CombinedClip
 *
 * The clip ID is "<stage>(<input ids>)"; provenance records the stage,
 * its version, the parameters and the input clip IDs.
 */
VideoClipPtr make_combined_clip(CombineConfigPtr config,
                                const std::string& stage_name,
                                const std::string& stage_version,
                                const std::map<std::string, std::string>& parameters);

} // namespace clipstack
