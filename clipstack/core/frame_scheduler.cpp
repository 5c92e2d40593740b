/*
 * File:        frame_scheduler.cpp
 * Module:      clipstack-core
 * Purpose:     Multi-threaded frame production
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "frame_scheduler.h"
#include "combine_errors.h"
#include "logging.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace clipstack {

FrameScheduler::FrameScheduler(std::shared_ptr<const FrameCombiner> combiner, int32_t max_threads)
    : combiner_(std::move(combiner))
    , max_threads_(max_threads)
    , abort_(false)
{
    if (!combiner_) {
        throw InvalidArgumentError("FrameScheduler requires a combiner");
    }
    if (max_threads_ <= 0) {
        max_threads_ = static_cast<int32_t>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

std::vector<FrameResult> FrameScheduler::render_all() {
    std::vector<uint64_t> indices(combiner_->video_info().frame_count);
    for (uint64_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }
    return render(std::move(indices));
}

std::vector<FrameResult> FrameScheduler::render(std::vector<uint64_t> indices) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    // Initialise processing state. A cancel() made while idle is kept and
    // applies to this render.
    was_cancelled_ = false;
    if (abort_) {
        CLIPSTACK_LOG_WARN("FrameScheduler: cancel requested before render, no frames will be produced");
    }
    indices_ = std::move(indices);
    next_slot_ = 0;
    output_slot_ = 0;
    pending_frames_.clear();
    ready_frames_.clear();
    results_.assign(indices_.size(), FrameResult{});
    finished_.assign(indices_.size(), false);
    for (size_t slot = 0; slot < indices_.size(); ++slot) {
        results_[slot].index = indices_[slot];
    }

    if (indices_.empty()) {
        finish_render();
        return {};
    }

    const int32_t thread_count = static_cast<int32_t>(
        std::min<size_t>(static_cast<size_t>(max_threads_), indices_.size()));

    CLIPSTACK_LOG_INFO("FrameScheduler: rendering {} frame(s) on {} thread(s)", indices_.size(), thread_count);
    const auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (int32_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(&FrameScheduler::worker, this);
    }

    // Wait for the workers to finish
    for (auto& thread : threads) {
        thread.join();
    }

    // Hand over anything queued after the last worker left the sink
    deliver_ready(true);

    size_t failed = 0;
    size_t cancelled = 0;
    for (size_t slot = 0; slot < results_.size(); ++slot) {
        if (!finished_[slot]) {
            results_[slot].code = ResultCode::ERROR_CANCELLED;
            results_[slot].message = "cancelled before start";
        }
        if (results_[slot].code == ResultCode::ERROR_CANCELLED) {
            ++cancelled;
        } else if (!results_[slot].ok()) {
            ++failed;
        }
    }
    pending_frames_.clear();
    ready_frames_.clear();

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (abort_) {
        CLIPSTACK_LOG_WARN("FrameScheduler: cancelled after {} ms ({} frame(s) not produced)",
                           elapsed_ms, cancelled);
    } else {
        CLIPSTACK_LOG_INFO("FrameScheduler: {} frame(s) in {} ms, {} failed",
                           results_.size(), elapsed_ms, failed);
    }

    finish_render();
    return std::move(results_);
}

void FrameScheduler::finish_render() {
    was_cancelled_ = abort_.load();
    abort_ = false;
}

// Take the next unstarted slot. Returns false when there is no more work.
bool FrameScheduler::get_next_slot(size_t& slot) {
    std::lock_guard<std::mutex> locker(input_mutex_);

    if (abort_ || next_slot_ >= indices_.size()) {
        return false;
    }
    slot = next_slot_++;
    return true;
}

// Record one result. Workers complete frames in arbitrary order, so frames
// wait in pending_frames_ until every earlier slot has finished, then move
// to ready_frames_ in index order.
void FrameScheduler::put_result(size_t slot, FrameResult result) {
    {
        std::lock_guard<std::mutex> locker(output_mutex_);

        if (result.ok()) {
            pending_frames_[slot] = result.frame;
        }
        results_[slot] = std::move(result);
        finished_[slot] = true;

        while (output_slot_ < finished_.size() && finished_[output_slot_]) {
            auto it = pending_frames_.find(output_slot_);
            if (it != pending_frames_.end()) {
                if (sink_) {
                    ready_frames_.emplace_back(indices_[output_slot_], it->second);
                }
                pending_frames_.erase(it);
            }
            ++output_slot_;
        }
    }

    deliver_ready(false);
}

// Pass ready frames to the sink outside output_mutex_, so a slow sink does
// not hold up workers recording results. Only the holder of sink_mutex_
// drains the queue, which keeps delivery in index order.
void FrameScheduler::deliver_ready(bool wait) {
    std::unique_lock<std::mutex> sink_lock(sink_mutex_, std::defer_lock);
    if (wait) {
        sink_lock.lock();
    } else if (!sink_lock.try_lock()) {
        return;
    }

    while (true) {
        std::pair<uint64_t, VideoFramePtr> next;
        {
            std::lock_guard<std::mutex> locker(output_mutex_);
            if (ready_frames_.empty()) {
                return;
            }
            next = std::move(ready_frames_.front());
            ready_frames_.pop_front();
        }

        if (abort_) {
            continue;
        }

        try {
            sink_(next.first, next.second);
        } catch (const std::exception& e) {
            CLIPSTACK_LOG_ERROR("FrameScheduler: sink failed on frame {}: {}", next.first, e.what());
            abort_ = true;
        }
    }
}

void FrameScheduler::worker() {
    size_t slot = 0;
    while (get_next_slot(slot)) {
        FrameResult result;
        result.index = indices_[slot];

        try {
            result.frame = combiner_->combine(result.index, &abort_);
            if (result.frame) {
                result.code = ResultCode::SUCCESS;
            } else {
                result.code = ResultCode::ERROR_CANCELLED;
                result.message = "cancelled while in progress";
            }
        } catch (const InvalidArgumentError& e) {
            result.code = ResultCode::ERROR_INVALID_ARGUMENT;
            result.message = e.what();
        } catch (const SourceFrameError& e) {
            result.code = ResultCode::ERROR_SOURCE_FRAME;
            result.message = e.what();
        } catch (const std::exception& e) {
            result.code = ResultCode::ERROR_INTERNAL;
            result.message = e.what();
        }

        if (is_error(result.code) && result.code != ResultCode::ERROR_CANCELLED) {
            CLIPSTACK_LOG_ERROR("FrameScheduler: frame {} failed ({}): {}",
                                result.index, result_code_name(result.code), result.message);
        }

        put_result(slot, std::move(result));
    }
}

} // namespace clipstack
