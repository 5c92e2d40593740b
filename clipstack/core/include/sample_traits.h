/*
 * File:        sample_traits.h
 * Module:      clipstack-core
 * Purpose:     Per-representation arithmetic and sample ordering helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "half_float.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace clipstack {

/**
 * @brief Arithmetic domain of a storage type
 *
 * value_type is the type samples are widened to before any arithmetic:
 * uint64_t for integer storage (no overflow for K * (2^32 - 1)) and
 * double for float storage.
 */
template <typename T>
struct SampleTraits {
    static_assert(std::is_unsigned<T>::value, "integer samples must be unsigned");

    using value_type = uint64_t;
    static constexpr bool is_integer = true;

    static value_type load(T v) { return static_cast<value_type>(v); }
    static T store(value_type v) { return static_cast<T>(v); }
};

template <>
struct SampleTraits<float> {
    using value_type = double;
    static constexpr bool is_integer = false;

    static value_type load(float v) { return static_cast<value_type>(v); }
    static float store(value_type v) { return static_cast<float>(v); }
};

template <>
struct SampleTraits<Half> {
    using value_type = double;
    static constexpr bool is_integer = false;

    static value_type load(Half v) { return static_cast<value_type>(half_to_float(v)); }
    static Half store(value_type v) { return float_to_half(static_cast<float>(v)); }
};

/**
 * @brief How samples are ordered for rank selection
 */
enum class SelectionStrategy {
    Auto,           // Insertion sort up to INSERTION_SORT_LIMIT samples, partial selection above
    InsertionSort,  // Full ordering by insertion sort
    PartialSelect   // std::nth_element on the required ranks only
};

/// Largest sample count for which Auto uses insertion sort
constexpr size_t INSERTION_SORT_LIMIT = 16;

template <typename V>
void insertion_sort(V* values, size_t n) {
    for (size_t i = 1; i < n; ++i) {
        V key = values[i];
        size_t j = i;
        while (j > 0 && key < values[j - 1]) {
            values[j] = values[j - 1];
            --j;
        }
        values[j] = key;
    }
}

inline bool use_insertion_sort(SelectionStrategy strategy, size_t n) {
    switch (strategy) {
        case SelectionStrategy::InsertionSort: return true;
        case SelectionStrategy::PartialSelect: return false;
        case SelectionStrategy::Auto: break;
    }
    return n <= INSERTION_SORT_LIMIT;
}

/**
 * @brief Put the samples of rank lo and hi (lo <= hi, hi == lo or lo + 1)
 *        at positions lo and hi
 */
template <typename V>
void order_ranks(V* values, size_t n, size_t lo, size_t hi, SelectionStrategy strategy) {
    if (use_insertion_sort(strategy, n)) {
        insertion_sort(values, n);
        return;
    }

    std::nth_element(values, values + hi, values + n);
    if (lo != hi) {
        // Everything before hi is <= values[hi]; rank lo is the largest of them
        V* lower = std::max_element(values, values + hi);
        std::iter_swap(lower, values + lo);
    }
}

/**
 * @brief Fully order the samples
 */
template <typename V>
void order_all(V* values, size_t n, SelectionStrategy strategy) {
    if (use_insertion_sort(strategy, n)) {
        insertion_sort(values, n);
    } else {
        std::sort(values, values + n);
    }
}

} // namespace clipstack
