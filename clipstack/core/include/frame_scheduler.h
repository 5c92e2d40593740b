/*
 * File:        frame_scheduler.h
 * Module:      clipstack-core
 * Purpose:     Multi-threaded frame production
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "error_codes.h"
#include "frame_combiner.h"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace clipstack {

/**
 * @brief Outcome of one frame request
 */
struct FrameResult {
    uint64_t index = 0;
    VideoFramePtr frame;                        // Set only on success
    ResultCode code = ResultCode::ERROR_UNKNOWN;
    std::string message;

    bool ok() const { return is_success(code) && frame != nullptr; }
};

/// Receives finished frames in ascending index order
using FrameSink = std::function<void(uint64_t index, const VideoFramePtr& frame)>;

/**
 * @brief Runs a FrameCombiner over a set of frame indices on worker threads
 *
 * Each worker repeatedly takes the next index from a shared counter and
 * combines it. A failure is recorded against its own index only. Frames
 * finish in arbitrary order; the sink sees them in index order, with
 * failed indices skipped. The sink is called from one worker at a time,
 * outside the lock that guards results, so workers keep combining while
 * it runs.
 */
class FrameScheduler {
public:
    /**
     * @param combiner Combiner to drive
     * @param max_threads Worker count (0 = hardware concurrency)
     */
    explicit FrameScheduler(std::shared_ptr<const FrameCombiner> combiner, int32_t max_threads = 0);

    /// Set before render(); it must not change while a render is running
    void set_sink(FrameSink sink) { sink_ = std::move(sink); }

    /**
     * @brief Produce the given frames
     *
     * Indices are sorted and de-duplicated. Returns one result per
     * distinct index, in ascending order. Blocks until every worker exits.
     */
    std::vector<FrameResult> render(std::vector<uint64_t> indices);

    /// Produce every frame of the clip
    std::vector<FrameResult> render_all();

    /**
     * @brief Stop the current render as soon as possible
     *
     * Safe to call from any thread, including from the sink. Unstarted
     * indices report ERROR_CANCELLED; frames in progress are dropped.
     * Called while no render is running, the request is held and the next
     * render produces nothing. Each render consumes the request.
     */
    void cancel() { abort_ = true; }

    /// True while a cancel is pending or if the last render was cancelled
    bool cancelled() const { return abort_ || was_cancelled_; }

    int32_t thread_count() const { return max_threads_; }

private:
    bool get_next_slot(size_t& slot);
    void put_result(size_t slot, FrameResult result);
    void deliver_ready(bool wait);
    void finish_render();
    void worker();

    std::shared_ptr<const FrameCombiner> combiner_;
    int32_t max_threads_;
    FrameSink sink_;

    // Shared abort flag; workers poll it between frames and the combiner
    // polls it between rows
    std::atomic<bool> abort_;
    std::atomic<bool> was_cancelled_{false};

    // Input state (guarded by input_mutex_ while threads are running)
    std::mutex input_mutex_;
    std::vector<uint64_t> indices_;
    size_t next_slot_ = 0;

    // Output state (guarded by output_mutex_ while threads are running)
    std::mutex output_mutex_;
    std::vector<FrameResult> results_;
    std::vector<bool> finished_;
    size_t output_slot_ = 0;
    std::map<size_t, VideoFramePtr> pending_frames_;
    std::deque<std::pair<uint64_t, VideoFramePtr>> ready_frames_;

    // Held by whichever worker is passing ready_frames_ to the sink
    std::mutex sink_mutex_;
};

} // namespace clipstack
