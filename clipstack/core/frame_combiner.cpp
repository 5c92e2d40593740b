/*
 * File:        frame_combiner.cpp
 * Module:      clipstack-core
 * Purpose:     Produce one output frame from K source frames
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "frame_combiner.h"
#include "combine_errors.h"
#include "logging.h"
#include "median_selector.h"
#include "sample_accumulator.h"
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <variant>

namespace clipstack {

FrameCombiner::FrameCombiner(CombineConfigPtr config, SelectionStrategy strategy)
    : config_(std::move(config))
    , strategy_(strategy)
{
    if (!config_) {
        throw InvalidArgumentError("FrameCombiner requires a configuration");
    }
}

std::vector<VideoFramePtr> FrameCombiner::fetch_sources(uint64_t n) const {
    const VideoInfo& info = config_->format.info;
    std::vector<VideoFramePtr> sources;
    sources.reserve(config_->clips.size());

    for (size_t i = 0; i < config_->clips.size(); ++i) {
        VideoFramePtr frame;
        try {
            frame = config_->clips[i]->get_frame(n);
        } catch (const CombineError&) {
            throw;
        } catch (const std::exception& e) {
            throw SourceFrameError(i, n, e.what());
        }

        if (!frame) {
            throw SourceFrameError(i, n, "source returned no frame");
        }
        // A frame must match the clip's declared format before its planes are read
        if (!(frame->format() == info.format)) {
            throw SourceFrameError(i, n, fmt::format(
                "frame format {} differs from clip format {}",
                frame->format().name(), info.format.name()));
        }
        if (frame->width() != info.width || frame->height() != info.height) {
            throw SourceFrameError(i, n, fmt::format(
                "frame is {}x{}, clip declares {}x{}",
                frame->width(), frame->height(), info.width, info.height));
        }
        sources.push_back(std::move(frame));
    }

    return sources;
}

VideoFramePtr FrameCombiner::combine(uint64_t n, const std::atomic<bool>* abort) const {
    const VideoInfo& info = config_->format.info;
    if (n >= info.frame_count) {
        throw InvalidArgumentError(fmt::format(
            "{}: frame {} out of range (clip has {} frames)",
            combine_mode_name(config_->mode), n, info.frame_count));
    }

    auto sources = fetch_sources(n);

    // Picture-type weights only apply to the weighted mean
    std::vector<double> weights;
    if (config_->mode == CombineMode::Mean && !config_->is_trimmed()) {
        std::vector<std::optional<PictureType>> types;
        types.reserve(sources.size());
        for (const auto& frame : sources) {
            types.push_back(picture_type_of(*frame));
        }
        weights = config_->weights.normalized_weights(types);
    }

    auto output = VideoFrame::create(info.format, info.width, info.height);

    const bool complete = std::visit([&](auto tag) {
        using T = typename decltype(tag)::storage_type;
        return combine_planes<T>(sources, *output, weights, abort);
    }, config_->format.representation);

    if (!complete) {
        CLIPSTACK_LOG_DEBUG("{}: frame {} aborted", combine_mode_name(config_->mode), n);
        return nullptr;
    }

    output->properties() = sources[0]->properties();

    CLIPSTACK_LOG_TRACE("{}: frame {} combined from {} clips",
                        combine_mode_name(config_->mode), n, sources.size());
    return output;
}

template <typename T>
bool FrameCombiner::combine_planes(const std::vector<VideoFramePtr>& sources,
                                   VideoFrame& output,
                                   const std::vector<double>& weights,
                                   const std::atomic<bool>* abort) const
{
    using value_type = typename SampleTraits<T>::value_type;

    const size_t k = sources.size();
    std::vector<T> samples(k);
    std::vector<value_type> scratch(k);
    std::vector<const T*> rows(k);

    auto for_each_pixel = [&](auto&& kernel) {
        for (uint32_t plane = 0; plane < output.plane_count(); ++plane) {
            const uint32_t width = output.plane_width(plane);
            const uint32_t height = output.plane_height(plane);

            for (uint32_t y = 0; y < height; ++y) {
                if (abort && abort->load(std::memory_order_relaxed)) {
                    return false;
                }

                for (size_t i = 0; i < k; ++i) {
                    rows[i] = sources[i]->template row<T>(plane, y);
                }
                T* dst = output.row_mut<T>(plane, y);

                for (uint32_t x = 0; x < width; ++x) {
                    for (size_t i = 0; i < k; ++i) {
                        samples[i] = rows[i][x];
                    }
                    dst[x] = kernel(samples.data());
                }
            }
        }
        return true;
    };

    if (config_->mode == CombineMode::Median) {
        MedianSelector<T> selector(strategy_);
        return for_each_pixel([&](const T* s) { return selector.select(s, k, scratch.data()); });
    }

    if (config_->is_trimmed()) {
        TrimmedMeanAccumulator<T> trimmed(k, config_->discard, strategy_);
        return for_each_pixel([&](const T* s) { return trimmed.combine(s, scratch.data()); });
    }

    MeanAccumulator<T> mean(weights, config_->format.info.format.bits_per_sample);
    return for_each_pixel([&](const T* s) { return mean.combine(s); });
}

} // namespace clipstack
