/******************************************************************************
 * test_weight_table.cpp
 *
 * Unit tests for weight presets and picture-type weighting
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 ******************************************************************************/

#include "weight_table.h"
#include "test_clips.h"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace clipstack;
using namespace clipstack::test;

namespace {

bool near(double a, double b, double eps = 1e-12) {
    return std::fabs(a - b) <= eps;
}

double sum_of(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x;
    return s;
}

} // anonymous namespace

void test_preset_values() {
    WeightMultipliers p0 = weights_for(0);
    assert(p0[0] == 1.0 && p0[1] == 1.0 && p0[2] == 1.0);

    WeightMultipliers p1 = weights_for(1);
    assert(p1[0] == 1.82 && p1[1] == 1.30 && p1[2] == 1.00);

    WeightMultipliers p2 = weights_for(2);
    assert(p2[0] == 1.21 && p2[1] == 1.10 && p2[2] == 1.00);

    WeightMultipliers p3 = weights_for(3);
    assert(p3[0] == 1.10 && p3[1] == 1.00 && p3[2] == 1.00);

    assert(is_known_preset(0));
    assert(is_known_preset(3));
    assert(!is_known_preset(4));
    assert(!is_known_preset(-1));

    std::cout << "test_preset_values: PASSED\n";
}

void test_unknown_preset_is_equal() {
    WeightTable table(7);
    assert(table.preset() == 7);
    assert(table.is_uniform());

    WeightMultipliers m = weights_for(-3);
    assert(m[0] == 1.0 && m[1] == 1.0 && m[2] == 1.0);

    std::cout << "test_unknown_preset_is_equal: PASSED\n";
}

void test_picture_type_property() {
    VideoFrame frame(gray(8), 4, 4);
    assert(!picture_type_of(frame).has_value());

    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("I"));
    assert(picture_type_of(frame) == PictureType::Intra);
    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("i"));
    assert(picture_type_of(frame) == PictureType::Intra);
    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("P"));
    assert(picture_type_of(frame) == PictureType::Predicted);
    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("p"));
    assert(picture_type_of(frame) == PictureType::Predicted);
    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("B"));
    assert(picture_type_of(frame) == PictureType::Bidirectional);

    // Unrecognised values and non-string properties carry no type
    frame.set_property(PICTURE_TYPE_PROPERTY, std::string("X"));
    assert(!picture_type_of(frame).has_value());
    frame.set_property(PICTURE_TYPE_PROPERTY, int64_t(1));
    assert(!picture_type_of(frame).has_value());

    std::cout << "test_picture_type_property: PASSED\n";
}

void test_normalization_sums_to_one() {
    const std::vector<std::optional<PictureType>> mixes[] = {
        {PictureType::Intra, PictureType::Predicted, PictureType::Bidirectional},
        {PictureType::Bidirectional, PictureType::Bidirectional},
        {std::nullopt, PictureType::Predicted, PictureType::Intra, PictureType::Bidirectional, std::nullopt},
        {PictureType::Intra},
    };

    for (int32_t preset = 0; preset <= 3; ++preset) {
        WeightTable table(preset);
        for (const auto& types : mixes) {
            auto w = table.normalized_weights(types);
            assert(w.size() == types.size());
            assert(near(sum_of(w), 1.0, 1e-9));
        }
    }

    std::cout << "test_normalization_sums_to_one: PASSED\n";
}

void test_weighting_ratios() {
    WeightTable table(1);

    // I vs B: 1.82 : 1.00
    auto w = table.normalized_weights({PictureType::Intra, PictureType::Bidirectional});
    assert(near(w[0], 1.82 / 2.82));
    assert(near(w[1], 1.00 / 2.82));
    assert(w[0] > w[1]);

    // Absent type weighs as Intra
    auto w2 = table.normalized_weights({std::nullopt, PictureType::Bidirectional});
    assert(near(w2[0], w[0]));

    // Same type everywhere gives equal weights
    auto w3 = table.normalized_weights({PictureType::Predicted, PictureType::Predicted, PictureType::Predicted});
    assert(near(w3[0], 1.0 / 3.0) && near(w3[1], 1.0 / 3.0) && near(w3[2], 1.0 / 3.0));

    assert(table.multiplier_for(std::nullopt) == 1.82);
    assert(table.multiplier_for(PictureType::Predicted) == 1.30);

    std::cout << "test_weighting_ratios: PASSED\n";
}

int main() {
    std::cout << "Running WeightTable tests...\n";

    test_preset_values();
    test_unknown_preset_is_equal();
    test_picture_type_property();
    test_normalization_sums_to_one();
    test_weighting_ratios();

    std::cout << "All WeightTable tests passed!\n";
    return 0;
}
