/*
 * File:        median_selector.h
 * Module:      clipstack-core
 * Purpose:     Per-pixel median of K samples
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "sample_traits.h"
#include <cstddef>

namespace clipstack {

/**
 * @brief Median of K samples of one storage type
 *
 * Odd K returns the middle sample. Even K returns the mean of the two
 * middle samples: (a + b + 1) / 2 for integers, (a + b) / 2 for float.
 */
template <typename T>
class MedianSelector {
public:
    using traits = SampleTraits<T>;
    using value_type = typename traits::value_type;

    explicit MedianSelector(SelectionStrategy strategy = SelectionStrategy::Auto)
        : strategy_(strategy) {}

    SelectionStrategy strategy() const { return strategy_; }

    /**
     * @param samples One sample per clip
     * @param count Number of samples (>= 1)
     * @param scratch Work buffer of at least count entries
     */
    T select(const T* samples, size_t count, value_type* scratch) const {
        if (count == 1) {
            return samples[0];
        }

        for (size_t k = 0; k < count; ++k) {
            scratch[k] = traits::load(samples[k]);
        }

        const size_t hi = count / 2;
        const size_t lo = (count % 2 == 0) ? hi - 1 : hi;
        order_ranks(scratch, count, lo, hi, strategy_);

        if (lo == hi) {
            return traits::store(scratch[hi]);
        }

        if constexpr (traits::is_integer) {
            return traits::store((scratch[lo] + scratch[hi] + 1) / 2);
        } else {
            return traits::store((scratch[lo] + scratch[hi]) / 2.0);
        }
    }

private:
    SelectionStrategy strategy_;
};

} // namespace clipstack
