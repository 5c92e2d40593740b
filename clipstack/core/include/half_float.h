/*
 * File:        half_float.h
 * Module:      clipstack-core
 * Purpose:     IEEE 754 binary16 sample storage and conversion
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <cstdint>
#include <cstring>

namespace clipstack {

/**
 * @brief 16-bit float sample as stored in a plane
 *
 * Arithmetic is never done on Half directly; samples are promoted to
 * float for accumulation and demoted once per output sample.
 */
struct Half {
    uint16_t bits;
};

static_assert(sizeof(Half) == 2, "Half must be two bytes");

/// Bitwise equality (NaN payloads compare equal to themselves)
inline bool operator==(Half a, Half b) { return a.bits == b.bits; }
inline bool operator!=(Half a, Half b) { return a.bits != b.bits; }

namespace half_detail {

inline uint32_t bit_cast_uint32(float v) {
    uint32_t ret;
    std::memcpy(&ret, &v, sizeof(ret));
    return ret;
}

inline float bit_cast_float(uint32_t v) {
    float ret;
    std::memcpy(&ret, &v, sizeof(ret));
    return ret;
}

} // namespace half_detail

/// Convert float to binary16, round to nearest, saturating to infinity
inline Half float_to_half(float x) {
    using namespace half_detail;

    const float magic = bit_cast_float(static_cast<uint32_t>(15) << 23);
    const uint32_t inf = 255UL << 23;
    const uint32_t f16inf = 31UL << 23;
    const uint32_t sign_mask = 0x80000000UL;
    const uint32_t round_mask = ~0x0FFFU;

    uint16_t ret;
    uint32_t f = bit_cast_uint32(x);
    uint32_t sign = f & sign_mask;
    f ^= sign;

    if (f >= inf) {
        // NaN stays NaN, infinity stays infinity
        ret = f > inf ? 0x7E00 : 0x7C00;
    } else {
        f &= round_mask;
        f = bit_cast_uint32(bit_cast_float(f) * magic);
        f -= round_mask;

        if (f > f16inf)
            f = f16inf;

        ret = static_cast<uint16_t>(f >> 13);
    }

    ret |= static_cast<uint16_t>(sign >> 16);
    return Half{ret};
}

/// Convert binary16 to float (exact)
inline float half_to_float(Half h) {
    using namespace half_detail;

    const float magic = bit_cast_float(static_cast<uint32_t>(113) << 23);
    const uint32_t shifted_exp = 0x7C00U << 13;

    uint32_t o = (static_cast<uint32_t>(h.bits) & 0x7FFFU) << 13;
    uint32_t exp = shifted_exp & o;
    o += static_cast<uint32_t>(127 - 15) << 23;

    if (exp == shifted_exp) {
        // Inf/NaN
        o += static_cast<uint32_t>(128 - 16) << 23;
    } else if (exp == 0) {
        // Zero/denormal
        o += 1U << 23;
        o = bit_cast_uint32(bit_cast_float(o) - magic);
    }

    o |= (static_cast<uint32_t>(h.bits) & 0x8000U) << 16;
    return bit_cast_float(o);
}

} // namespace clipstack
