// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace errol {
namespace impl {

// A real number represented as the unevaluated sum base + offset of two doubles.
//
// After Normalize(), base is the double nearest to the sum and offset holds the
// rounding error, which gives roughly 106 bits of precision.
//
// NB:
// The error-free transformations below rely on every operation being rounded
// individually. The build must not contract them into fused multiply-adds.
struct DoubleDouble
{
    double base = 0.0;
    double offset = 0.0;

    constexpr DoubleDouble() = default;
    constexpr DoubleDouble(double base_, double offset_ = 0.0) : base(base_), offset(offset_) {}

    void Normalize()
    {
        const double sum = base + offset;
        offset -= sum - base;
        base = sum;
    }

    // 10x = 8x + 2x. Both products are exact, so only the sum is rounded and c
    // recovers its error.
    void MultiplyBy10()
    {
        const double h = 8 * base + 2 * base;
        const double l = 10 * offset;
        const double c = (h - 8 * base) - 2 * base;

        base = h;
        offset = l - c;

        Normalize();
    }

    void DivideBy10()
    {
        const double h = base / 10.0;
        const double l = offset / 10.0;
        const double c = (base - 8.0 * h) - 2.0 * h;

        base = h;
        offset = l + c / 10.0;

        Normalize();
    }

    // The result is not normalized.
    DoubleDouble operator*(double value) const;
};

// Splits x into a high part with at most 26 significant bits and the exact
// remainder, such that products of two high parts are exact.
inline DoubleDouble Split(double x)
{
    const uint64_t bits = ReinterpretBits<uint64_t>(x) & 0xFFFFFFFFF8000000ull;
    const double hi = ReinterpretBits<double>(bits);
    return DoubleDouble(hi, x - hi);
}

inline DoubleDouble DoubleDouble::operator*(double value) const
{
    const DoubleDouble factor1 = Split(base);
    const DoubleDouble factor2 = Split(value);

    const double product = base * value;
    const double error = (factor1.base * factor2.base - product)
                       + factor1.base * factor2.offset
                       + factor1.offset * factor2.base
                       + factor1.offset * factor2.offset;

    return DoubleDouble(product, offset * value + error);
}

} // namespace impl
} // namespace errol
