/*
 * File:        frame_combiner.h
 * Module:      clipstack-core
 * Purpose:     Produce one output frame from K source frames
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "combine_config.h"
#include "sample_traits.h"
#include "video_frame.h"
#include <atomic>
#include <cstdint>
#include <vector>

namespace clipstack {

/**
 * @brief Per-frame combine engine
 *
 * Holds only the shared, immutable CombineConfig, so combine() may be
 * called concurrently from any number of threads for any indices.
 */
class FrameCombiner {
public:
    explicit FrameCombiner(CombineConfigPtr config,
                           SelectionStrategy strategy = SelectionStrategy::Auto);

    const CombineConfig& config() const { return *config_; }
    const VideoInfo& video_info() const { return config_->format.info; }

    /**
     * @brief Build output frame n
     *
     * @param n Frame index
     * @param abort Optional flag polled once per row
     * @return The complete frame, or nullptr if aborted
     *
     * @throws InvalidArgumentError if n is out of range
     * @throws SourceFrameError if a source frame cannot be fetched
     */
    VideoFramePtr combine(uint64_t n, const std::atomic<bool>* abort = nullptr) const;

private:
    std::vector<VideoFramePtr> fetch_sources(uint64_t n) const;

    template <typename T>
    bool combine_planes(const std::vector<VideoFramePtr>& sources,
                        VideoFrame& output,
                        const std::vector<double>& weights,
                        const std::atomic<bool>* abort) const;

    CombineConfigPtr config_;
    SelectionStrategy strategy_;
};

} // namespace clipstack
