/*
 * File:        sample_accumulator.h
 * Module:      clipstack-core
 * Purpose:     Weighted and trimmed mean of K samples
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "sample_traits.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace clipstack {

/// Largest value representable in an unsigned integer of the given width
inline uint64_t max_sample_value(uint32_t bits) {
    return bits >= 64 ? UINT64_MAX : (uint64_t(1) << bits) - 1;
}

/**
 * @brief Weighted mean of one pixel position across K clips
 *
 * Built once per output frame from the normalized weights of that frame.
 *
 * Integer storage with equal weights: samples are summed in uint64_t and
 * divided by K with round half up, so the result is the exact rounded
 * arithmetic mean.
 *
 * Integer storage with unequal weights: the weighted sum is accumulated in
 * double in clip order, rounded half up and clamped to the sample range.
 * A double carries 53 bits, well beyond a 32-bit sample plus the weight
 * resolution.
 *
 * Float storage: weights and sums are kept in double, always in clip order.
 */
template <typename T>
class MeanAccumulator {
public:
    using traits = SampleTraits<T>;
    using value_type = typename traits::value_type;

    /**
     * @param weights Normalized weight per clip (sum == 1)
     * @param bits Bits per sample of integer storage, ignored for float
     */
    MeanAccumulator(const std::vector<double>& weights, uint32_t bits)
        : count_(weights.size())
        , weights_(weights)
    {
        if (weights.empty()) {
            throw std::invalid_argument("MeanAccumulator requires at least one weight");
        }

        equal_ = std::all_of(weights.begin(), weights.end(),
                             [&weights](double w) { return w == weights.front(); });

        if constexpr (traits::is_integer) {
            max_value_ = max_sample_value(bits);
        } else {
            (void)bits;
        }
    }

    size_t count() const { return count_; }

    /// True when every clip carries the same weight
    bool equal_weights() const { return equal_; }

    /// Combine count() samples, one per clip, in clip order
    T combine(const T* samples) const {
        if constexpr (traits::is_integer) {
            if (equal_) {
                uint64_t sum = 0;
                for (size_t k = 0; k < count_; ++k) {
                    sum += traits::load(samples[k]);
                }
                const uint64_t n = static_cast<uint64_t>(count_);
                return traits::store((2 * sum + n) / (2 * n));
            }

            double acc = 0.0;
            for (size_t k = 0; k < count_; ++k) {
                acc += static_cast<double>(traits::load(samples[k])) * weights_[k];
            }
            return traits::store(round_to_sample(acc));
        } else {
            double acc = 0.0;
            for (size_t k = 0; k < count_; ++k) {
                acc += traits::load(samples[k]) * weights_[k];
            }
            return traits::store(acc);
        }
    }

private:
    // Round half up and clamp to [0, max_value_]
    uint64_t round_to_sample(double value) const {
        const double rounded = std::floor(value + 0.5);
        if (rounded <= 0.0) {
            return 0;
        }
        if (rounded >= static_cast<double>(max_value_)) {
            return max_value_;
        }
        return static_cast<uint64_t>(rounded);
    }

    size_t count_;
    std::vector<double> weights_;
    bool equal_ = false;
    uint64_t max_value_ = 0;
};

/**
 * @brief Unweighted mean of the K samples left after dropping the
 *        `discard` lowest and `discard` highest values
 *
 * Uses the same rounding as MeanAccumulator.
 */
template <typename T>
class TrimmedMeanAccumulator {
public:
    using traits = SampleTraits<T>;
    using value_type = typename traits::value_type;

    TrimmedMeanAccumulator(size_t count, size_t discard,
                           SelectionStrategy strategy = SelectionStrategy::Auto)
        : count_(count)
        , discard_(discard)
        , strategy_(strategy)
    {
        if (count == 0 || 2 * discard >= count) {
            throw std::invalid_argument("TrimmedMeanAccumulator: discard must leave at least one sample");
        }
    }

    size_t count() const { return count_; }
    size_t discard() const { return discard_; }
    size_t kept() const { return count_ - 2 * discard_; }

    /**
     * @brief Combine count() samples
     *
     * @param samples One sample per clip
     * @param scratch Work buffer of at least count() entries
     */
    T combine(const T* samples, value_type* scratch) const {
        for (size_t k = 0; k < count_; ++k) {
            scratch[k] = traits::load(samples[k]);
        }
        order_all(scratch, count_, strategy_);

        const size_t kept_count = kept();
        value_type sum = 0;
        for (size_t k = discard_; k < count_ - discard_; ++k) {
            sum += scratch[k];
        }

        if constexpr (traits::is_integer) {
            const uint64_t n = static_cast<uint64_t>(kept_count);
            return traits::store((2 * sum + n) / (2 * n));
        } else {
            return traits::store(sum / static_cast<double>(kept_count));
        }
    }

private:
    size_t count_;
    size_t discard_;
    SelectionStrategy strategy_;
};

} // namespace clipstack
