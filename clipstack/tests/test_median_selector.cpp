/******************************************************************************
 * test_median_selector.cpp
 *
 * Unit tests for the per-pixel median kernel
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 ******************************************************************************/

#include "median_selector.h"
#include "sample_accumulator.h"
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

using namespace clipstack;

void test_odd_count() {
    MedianSelector<uint8_t> sel;
    std::vector<uint64_t> scratch(5);

    const uint8_t a[] = {10, 20, 30};
    assert(sel.select(a, 3, scratch.data()) == 20);

    const uint8_t b[] = {200, 3, 50, 50, 7};
    assert(sel.select(b, 5, scratch.data()) == 50);

    // Input is left untouched
    assert(b[0] == 200 && b[1] == 3);

    std::cout << "test_odd_count: PASSED\n";
}

void test_even_count_rounding() {
    MedianSelector<uint16_t> sel;
    std::vector<uint64_t> scratch(4);

    // Middle pair 20, 31 -> 25.5 -> 26
    const uint16_t a[] = {31, 1000, 20, 0};
    assert(sel.select(a, 4, scratch.data()) == 26);

    // Middle pair 20, 30 -> 25 exactly
    const uint16_t b[] = {30, 20};
    assert(sel.select(b, 2, scratch.data()) == 25);

    MedianSelector<float> fsel;
    std::vector<double> fscratch(4);
    const float f[] = {0.25f, 1.0f, 0.5f, -3.0f};
    assert(fsel.select(f, 4, fscratch.data()) == 0.375f);

    std::cout << "test_even_count_rounding: PASSED\n";
}

void test_single_and_pair() {
    MedianSelector<uint32_t> sel;
    std::vector<uint64_t> scratch(2);

    const uint32_t one[] = {123456789u};
    assert(sel.select(one, 1, scratch.data()) == 123456789u);

    // A pair matches the two-way mean, including at the 32-bit limit
    MeanAccumulator<uint32_t> mean(std::vector<double>(2, 0.5), 32);
    const uint32_t pairs[][2] = {
        {0, 1}, {7, 8}, {100, 200}, {UINT32_MAX, UINT32_MAX - 1}, {UINT32_MAX, 0}, {UINT32_MAX, UINT32_MAX}
    };
    for (const auto& p : pairs) {
        assert(sel.select(p, 2, scratch.data()) == mean.combine(p));
    }

    std::cout << "test_single_and_pair: PASSED\n";
}

void test_strategies_agree() {
    // Deterministic pseudo-random samples
    uint32_t state = 12345;
    auto next = [&state]() {
        state = state * 1103515245u + 12345u;
        return static_cast<uint16_t>((state >> 16) & 0x3FF);
    };

    MedianSelector<uint16_t> insertion(SelectionStrategy::InsertionSort);
    MedianSelector<uint16_t> partial(SelectionStrategy::PartialSelect);
    MedianSelector<uint16_t> automatic;
    assert(automatic.strategy() == SelectionStrategy::Auto);

    for (size_t k = 1; k <= 40; ++k) {
        std::vector<uint16_t> samples(k);
        std::vector<uint64_t> scratch(k);
        for (int round = 0; round < 20; ++round) {
            for (auto& s : samples) s = next();

            // Reference: full sort
            std::vector<uint16_t> sorted = samples;
            std::sort(sorted.begin(), sorted.end());
            uint32_t expected = (k % 2 == 1)
                ? sorted[k / 2]
                : (static_cast<uint32_t>(sorted[k / 2 - 1]) + sorted[k / 2] + 1) / 2;

            assert(insertion.select(samples.data(), k, scratch.data()) == expected);
            assert(partial.select(samples.data(), k, scratch.data()) == expected);
            assert(automatic.select(samples.data(), k, scratch.data()) == expected);
        }
    }

    std::cout << "test_strategies_agree: PASSED\n";
}

void test_order_ranks() {
    std::vector<int> v = {9, 1, 8, 2, 7, 3, 6, 4, 5, 0};
    order_ranks(v.data(), v.size(), 4, 5, SelectionStrategy::PartialSelect);
    assert(v[4] == 4);
    assert(v[5] == 5);

    std::vector<int> w = {3, 1, 2};
    insertion_sort(w.data(), w.size());
    assert(w[0] == 1 && w[1] == 2 && w[2] == 3);

    assert(use_insertion_sort(SelectionStrategy::Auto, INSERTION_SORT_LIMIT));
    assert(!use_insertion_sort(SelectionStrategy::Auto, INSERTION_SORT_LIMIT + 1));

    std::cout << "test_order_ranks: PASSED\n";
}

int main() {
    std::cout << "Running MedianSelector tests...\n";

    test_odd_count();
    test_even_count_rounding();
    test_single_and_pair();
    test_strategies_agree();
    test_order_ranks();

    std::cout << "All MedianSelector tests passed!\n";
    return 0;
}
