// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "errol.h"

#include "double_double.h"
#include "format_digits.h"
#include "ieee.h"
#include "powers_of_10.h"

#ifndef ERROL_INTEGER_PATH
#define ERROL_INTEGER_PATH() 1
#endif

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>

#ifndef ERROL_ASSERT
#define ERROL_ASSERT(X) assert(X)
#endif

using errol::impl::DoubleDouble;

using Double = errol::IEEE<double>;

//==================================================================================================
// Exact integers
//
// For integers in [2^53, 2^125) the neighbours are at least 2 apart and the candidate digit
// strings cannot be separated reliably in double-double precision. All quantities fit into
// 128-bit integers, so the shortest digits are computed exactly.
//==================================================================================================

#if ERROL_INTEGER_PATH()

namespace {

__extension__ using uint128_t = unsigned __int128;

struct RoundingInterval
{
    // All bounds are scaled by 4.
    uint128_t lower;
    uint128_t value;
    uint128_t upper;
    bool inclusive;

    bool Contains(uint128_t c) const
    {
        return (lower < c && c < upper) || (inclusive && (c == lower || c == upper));
    }

    // Returns whether the interval contains a multiple of p.
    // PRE: p <= upper
    bool ContainsMultipleOf(uint128_t p) const
    {
        uint128_t c = (lower + (p - 1)) / p * p;
        if (!inclusive && c == lower)
            c += p;
        return c < upper || (inclusive && c == upper);
    }
};

} // namespace

static constexpr int MinIntegerExponent = 1;
static constexpr int MaxIntegerExponent = 72;

static inline bool IsLargeInteger(const Double v)
{
    const int e2 = static_cast<int>(v.PhysicalExponent()) - Double::ExponentBias;
    return v.PhysicalExponent() != 0 && MinIntegerExponent <= e2 && e2 <= MaxIntegerExponent;
}

// PRE: IsLargeInteger(v)
static int GenerateIntegerDigits(char* digits, int& exponent, const Double v)
{
    const uint64_t f = v.PhysicalSignificand() | Double::HiddenBit;
    const int e2 = static_cast<int>(v.PhysicalExponent()) - Double::ExponentBias;

    // The lower neighbour is closer if f is a power of two.
    const bool lower_boundary_is_closer = v.PhysicalSignificand() == 0 && v.PhysicalExponent() > 1;

    RoundingInterval interval;
    interval.lower = uint128_t{4 * f - 2 + (lower_boundary_is_closer ? 1u : 0u)} << e2;
    interval.value = uint128_t{4 * f} << e2;
    interval.upper = uint128_t{4 * f + 2} << e2;
    interval.inclusive = (f % 2) == 0;

    // Find the largest p = 4 * 10^k with a multiple in the interval.
    // The value itself is a multiple of 4, so k = 0 always works.
    uint128_t p = 4;
    int k = 0;
    while (p <= interval.upper / 10 && interval.ContainsMultipleOf(p * 10))
    {
        p *= 10;
        ++k;
    }

    // Of the two multiples of p around the value, pick the nearer one that is in the interval.
    // Ties go to the even quotient.
    const uint128_t below = interval.value / p * p;
    const uint128_t above = below + p;

    uint128_t c;
    if (interval.Contains(below) && interval.Contains(above))
    {
        const uint128_t distance_below = interval.value - below;
        const uint128_t distance_above = above - interval.value;
        if (distance_below < distance_above)
            c = below;
        else if (distance_above < distance_below)
            c = above;
        else
            c = (below / p) % 2 == 0 ? below : above;
    }
    else if (interval.Contains(below))
    {
        c = below;
    }
    else
    {
        ERROL_ASSERT(interval.Contains(above));
        c = above;
    }

    uint128_t q = c / p;
    while (q % 10 == 0)
    {
        q /= 10;
        ++k;
    }

    // At most 17 digits.
    ERROL_ASSERT(q < 100000000000000000ull);
    uint64_t output = static_cast<uint64_t>(q);

    char scratch[20];
    int num_digits = 0;
    do
    {
        scratch[num_digits++] = static_cast<char>('0' + output % 10);
        output /= 10;
    }
    while (output != 0);

    for (int i = 0; i < num_digits; ++i)
    {
        digits[i] = scratch[num_digits - 1 - i];
    }

    exponent = num_digits + k;
    return num_digits;
}

#endif // ERROL_INTEGER_PATH()

//==================================================================================================
// Errol1
//==================================================================================================

// Widens the scaled distance to the neighbours slightly, since the power of ten is not exact.
static constexpr double Epsilon = 8.78e-15;

// Multiplications of the scale factor that would take it past this limit are
// deferred and applied to the boundary distances instead.
static constexpr double MaxScaleFactor = 1e307;

static inline bool IsAtLeast10(const DoubleDouble& x)
{
    return x.base > 10.0 || (x.base == 10.0 && x.offset >= 0.0);
}

static inline bool IsBelow1(const DoubleDouble& x)
{
    return x.base < 1.0 || (x.base == 1.0 && x.offset < 0.0);
}

// Returns (neighbour - value) * factor * 10^scale_shift.
static inline double ScaledDistance(double neighbour, double value, double factor, int scale_shift)
{
    double distance = (neighbour - value) * factor;
    for (int i = 0; i < scale_shift; ++i)
    {
        distance *= 10.0;
    }
    return distance;
}

static int GenerateDoubleDoubleDigits(char* digits, int& exponent, const Double v)
{
    const double value = v.Value();

    //
    // Estimate the decimal exponent and scale the value into [1, 10).
    //

    int k = 1 - static_cast<int>(v.BinaryExponent() * 0.30103);
    if (k > errol::impl::MaxPowerOf10)
        k = errol::impl::MaxPowerOf10;
    else if (k < errol::impl::MinPowerOf10)
        k = errol::impl::MinPowerOf10;

    int e = 1 - k;

    const DoubleDouble scale = errol::impl::PowerOf10(k);
    double scale_base = scale.base;
    int scale_shift = 0;

    DoubleDouble mid = scale * value;

    while (IsAtLeast10(mid))
    {
        mid.DivideBy10();
        ++e;
        if (scale_shift > 0)
            --scale_shift;
        else
            scale_base /= 10.0;
    }

    while (IsBelow1(mid))
    {
        mid.MultiplyBy10();
        --e;
        if (scale_base > MaxScaleFactor)
            ++scale_shift;
        else
            scale_base *= 10.0;
    }

    //
    // Compute the boundaries, halfway between the value and its neighbours.
    //

    const double factor = scale_base / (2.0 + Epsilon);

    DoubleDouble lower(mid.base, mid.offset + ScaledDistance(v.PrevValue(), value, factor, scale_shift));
    lower.Normalize();
    DoubleDouble upper(mid.base, mid.offset + ScaledDistance(v.NextValue(), value, factor, scale_shift));
    upper.Normalize();

    //
    // The upper boundary may have crossed a power of ten.
    //

    while (IsAtLeast10(upper))
    {
        lower.DivideBy10();
        upper.DivideBy10();
        ++e;
    }

    while (IsBelow1(upper))
    {
        lower.MultiplyBy10();
        upper.MultiplyBy10();
        --e;
    }

    //
    // Generate digits while both boundaries agree.
    //

    int num_digits = 0;
    for (;;)
    {
        ERROL_ASSERT(num_digits < errol::DigitsBufferLength);

        int digit_lower = static_cast<int>(lower.base);
        int digit_upper = static_cast<int>(upper.base);
        if (lower.base == digit_lower && lower.offset < 0.0)
            --digit_lower;
        if (upper.base == digit_upper && upper.offset < 0.0)
            --digit_upper;

        if (digit_lower != digit_upper)
        {
            const int digit = static_cast<int>((digit_upper + digit_lower) / 2.0 + 0.5);
            digits[num_digits++] = static_cast<char>('0' + digit);
            break;
        }

        digits[num_digits++] = static_cast<char>('0' + digit_upper);

        lower.base -= digit_lower;
        upper.base -= digit_upper;
        upper.MultiplyBy10();
        lower.MultiplyBy10();

        if (upper.base == 0.0 && upper.offset == 0.0)
            break;
    }

    exponent = e;
    return num_digits;
}

int errol::GenerateDigits(char* digits, int& exponent, double value)
{
    const Double v(value);

    ERROL_ASSERT(v.IsFinite());
    ERROL_ASSERT(!v.SignBit());
    ERROL_ASSERT(!v.IsZero());
    ERROL_ASSERT(value < std::numeric_limits<double>::max());

#if ERROL_INTEGER_PATH()
    if (IsLargeInteger(v))
    {
        return GenerateIntegerDigits(digits, exponent, v);
    }
#endif

    return GenerateDoubleDoubleDigits(digits, exponent, v);
}

errol::DecimalDigits errol::ToDigits(char* buffer, double value)
{
    const Double v(value);

    DecimalDigits dec;
    dec.sign = v.SignBit();

    if (!v.IsFinite())
    {
        std::memcpy(buffer, v.IsNaN() ? "NaN" : "Inf", 3);
        dec.length = 3;
        dec.exponent = SpecialExponent;
        return dec;
    }

    if (v.IsZero())
    {
        buffer[0] = '0';
        dec.length = 1;
        dec.exponent = 1;
        return dec;
    }

    // The upper neighbour of the largest double is infinity.
    const double abs_value = v.AbsValue();
    if (abs_value == std::numeric_limits<double>::max())
    {
        std::memcpy(buffer, "17976931348623157", 17);
        dec.length = 17;
        dec.exponent = 309;
        return dec;
    }

    dec.length = GenerateDigits(buffer, dec.exponent, abs_value);
    return dec;
}

char* errol::Dtoa(char* buffer, double value, int precision)
{
    if (precision < 1)
        precision = 1;
    if (precision > MaxPrecision)
        precision = MaxPrecision;

    char digits[DigitsBufferLength];
    const DecimalDigits dec = ToDigits(digits, value);

    if (dec.sign)
    {
        *buffer++ = '-';
    }

    if (dec.exponent == SpecialExponent)
    {
        std::memcpy(buffer, digits, 3);
        return buffer + 3;
    }

    return FormatDigits(buffer, digits, dec.length, dec.exponent, precision);
}
