/******************************************************************************
 * test_frame_scheduler.cpp
 *
 * Tests for multi-threaded frame production
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 ******************************************************************************/

#include "combine_config.h"
#include "frame_scheduler.h"
#include "test_clips.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace clipstack;
using namespace clipstack::test;

namespace {

// Clip where frame n is filled with (n * step) & 0xFF
std::shared_ptr<MemoryClip> ramp_clip(const std::string& id, uint64_t frames, uint32_t step) {
    auto clip = std::make_shared<MemoryClip>(ArtifactID(id), yuv420(8), 16, 8);
    for (uint64_t n = 0; n < frames; ++n) {
        auto frame = clip->add_blank_frame();
        fill_frame<uint8_t>(*frame, static_cast<uint8_t>((n * step) & 0xFF));
    }
    return clip;
}

std::shared_ptr<const FrameCombiner> make_combiner(const std::vector<VideoClipPtr>& clips) {
    return std::make_shared<const FrameCombiner>(make_combine_config(clips, CombineMode::Mean));
}

} // anonymous namespace

void test_render_all_in_order() {
    auto a = ramp_clip("a", 24, 2);
    auto b = ramp_clip("b", 24, 4);
    FrameScheduler scheduler(make_combiner(as_inputs({a, b})), 4);
    assert(scheduler.thread_count() == 4);

    std::mutex seen_mutex;
    std::vector<uint64_t> seen;
    scheduler.set_sink([&](uint64_t index, const VideoFramePtr& frame) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        assert(frame);
        seen.push_back(index);
    });

    auto results = scheduler.render_all();
    assert(results.size() == 24);
    assert(seen.size() == 24);
    for (uint64_t n = 0; n < 24; ++n) {
        assert(seen[n] == n);
        assert(results[n].index == n);
        assert(results[n].ok());
        // Mean of 2n and 4n
        const uint32_t expected = (((n * 2) & 0xFF) + ((n * 4) & 0xFF) + 1) / 2;
        assert(frame_is_constant<uint8_t>(*results[n].frame, static_cast<uint8_t>(expected)));
    }

    std::cout << "test_render_all_in_order: PASSED\n";
}

void test_failures_are_isolated() {
    auto a = ramp_clip("a", 10, 1);
    auto b = ramp_clip("b", 6, 1);
    b->set_frame_count(10);  // Frames 6..9 cannot be fetched

    FrameScheduler scheduler(make_combiner(as_inputs({a, b})), 3);

    std::vector<uint64_t> seen;
    scheduler.set_sink([&](uint64_t index, const VideoFramePtr&) {
        seen.push_back(index);
    });

    auto results = scheduler.render_all();
    assert(results.size() == 10);
    for (uint64_t n = 0; n < 10; ++n) {
        if (n < 6) {
            assert(results[n].ok());
            assert(results[n].code == ResultCode::SUCCESS);
        } else {
            assert(!results[n].ok());
            assert(results[n].code == ResultCode::ERROR_SOURCE_FRAME);
            assert(!results[n].message.empty());
            assert(results[n].frame == nullptr);
        }
    }

    // Sink saw only the good frames, in order
    assert(seen.size() == 6);
    for (uint64_t n = 0; n < 6; ++n) {
        assert(seen[n] == n);
    }

    std::cout << "test_failures_are_isolated: PASSED\n";
}

void test_index_selection() {
    auto a = ramp_clip("a", 5, 1);
    FrameScheduler scheduler(make_combiner(as_inputs({a})), 2);

    auto results = scheduler.render({3, 1, 3, 100});
    assert(results.size() == 3);
    assert(results[0].index == 1 && results[0].ok());
    assert(results[1].index == 3 && results[1].ok());
    assert(results[2].index == 100);
    assert(results[2].code == ResultCode::ERROR_INVALID_ARGUMENT);

    assert(scheduler.render({}).empty());

    std::cout << "test_index_selection: PASSED\n";
}

void test_cancel_from_sink() {
    auto a = ramp_clip("a", 12, 1);
    FrameScheduler scheduler(make_combiner(as_inputs({a})), 1);

    size_t delivered = 0;
    scheduler.set_sink([&](uint64_t, const VideoFramePtr&) {
        ++delivered;
        scheduler.cancel();
    });

    auto results = scheduler.render_all();
    assert(scheduler.cancelled());
    assert(delivered == 1);
    assert(results.size() == 12);
    assert(results[0].ok());
    for (size_t i = 1; i < results.size(); ++i) {
        assert(results[i].code == ResultCode::ERROR_CANCELLED);
        assert(results[i].frame == nullptr);
    }

    // A new render starts afresh
    scheduler.set_sink(nullptr);
    auto again = scheduler.render({0, 1});
    assert(again.size() == 2 && again[0].ok() && again[1].ok());

    std::cout << "test_cancel_from_sink: PASSED\n";
}

void test_cancel_before_render() {
    auto a = ramp_clip("a", 6, 1);
    FrameScheduler scheduler(make_combiner(as_inputs({a})), 2);

    size_t delivered = 0;
    scheduler.set_sink([&](uint64_t, const VideoFramePtr&) { ++delivered; });

    // A cancel made while idle stops the next render before it starts
    scheduler.cancel();
    assert(scheduler.cancelled());
    auto results = scheduler.render_all();
    assert(results.size() == 6);
    for (const auto& r : results) {
        assert(r.code == ResultCode::ERROR_CANCELLED);
    }
    assert(delivered == 0);
    assert(scheduler.cancelled());

    // The request was consumed by that render
    auto again = scheduler.render_all();
    assert(!scheduler.cancelled());
    assert(delivered == 6);
    for (const auto& r : again) {
        assert(r.ok());
    }

    std::cout << "test_cancel_before_render: PASSED\n";
}

void test_slow_sink_keeps_order() {
    auto a = ramp_clip("a", 16, 3);
    FrameScheduler scheduler(make_combiner(as_inputs({a})), 4);

    // Workers keep combining while the first frame is held in the sink;
    // delivery is still complete and in order, one call at a time
    std::atomic<size_t> delivered(0);
    std::vector<uint64_t> seen;
    scheduler.set_sink([&](uint64_t index, const VideoFramePtr&) {
        if (delivered == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        seen.push_back(index);
        ++delivered;
    });

    auto results = scheduler.render_all();
    assert(results.size() == 16);
    assert(delivered == 16);
    for (uint64_t n = 0; n < 16; ++n) {
        assert(results[n].ok());
        assert(seen[n] == n);
    }

    std::cout << "test_slow_sink_keeps_order: PASSED\n";
}

void test_default_thread_count() {
    auto a = ramp_clip("a", 2, 1);
    FrameScheduler scheduler(make_combiner(as_inputs({a})));
    assert(scheduler.thread_count() >= 1);

    std::cout << "test_default_thread_count: PASSED\n";
}

int main() {
    std::cout << "Running FrameScheduler tests...\n";

    test_render_all_in_order();
    test_failures_are_isolated();
    test_index_selection();
    test_cancel_from_sink();
    test_cancel_before_render();
    test_slow_sink_keeps_order();
    test_default_thread_count();

    std::cout << "All FrameScheduler tests passed!\n";
    return 0;
}
