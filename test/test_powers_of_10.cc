#include "catch2/catch.hpp"

#include "powers_of_10.h"

#include <cmath>
#include <cstdlib>
#include <string>

using errol::impl::DoubleDouble;
using errol::impl::PowerOf10;

TEST_CASE("PowerOf10 - Base is correctly rounded")
{
    for (int k = errol::impl::MinPowerOf10; k <= errol::impl::MaxPowerOf10; ++k)
    {
        CAPTURE(k);

        const DoubleDouble p = PowerOf10(k);
        const double expected = std::strtod(("1e" + std::to_string(k)).c_str(), nullptr);
        CHECK(p.base == expected);

        // Normalized
        CHECK(p.base + p.offset == p.base);
    }
}

TEST_CASE("PowerOf10 - Exact powers")
{
    double p = 1.0;
    for (int k = 0; k <= 22; ++k)
    {
        CAPTURE(k);
        CHECK(PowerOf10(k).base == p);
        CHECK(PowerOf10(k).offset == 0.0);
        p *= 10;
    }
}

TEST_CASE("PowerOf10 - Integers")
{
    __extension__ using int128_t = __int128;

    // 10^22
    int128_t exact = 1;
    for (int k = 1; k <= 22; ++k)
        exact *= 10;

    // 10^38 < 2^127
    for (int k = 23; k <= 38; ++k)
    {
        exact *= 10;
        CAPTURE(k);

        const DoubleDouble p = PowerOf10(k);
        const int128_t base = static_cast<int128_t>(p.base);
        CHECK(static_cast<double>(exact - base) == p.offset);
    }
}

TEST_CASE("PowerOf10 - Reciprocals")
{
    for (int k = 0; k <= -errol::impl::MinPowerOf10; ++k)
    {
        CAPTURE(k);

        const DoubleDouble p = PowerOf10(k);
        const DoubleDouble q = PowerOf10(-k);

        DoubleDouble one = p * q.base;
        one.offset += p.base * q.offset;
        one.Normalize();

        CHECK(std::abs((one.base - 1.0) + one.offset) < 1e-30);
    }
}

TEST_CASE("PowerOf10 - Adjacent entries")
{
    for (int k = errol::impl::MinPowerOf10; k < errol::impl::MaxPowerOf10; ++k)
    {
        CAPTURE(k);

        const DoubleDouble lo = PowerOf10(k);
        const DoubleDouble hi = PowerOf10(k + 1);

        DoubleDouble up = lo;
        up.MultiplyBy10();
        CHECK(std::abs((up.base - hi.base) + (up.offset - hi.offset)) <= 1e-31 * hi.base);

        DoubleDouble down = hi;
        down.DivideBy10();
        CHECK(std::abs((down.base - lo.base) + (down.offset - lo.offset)) <= 1e-31 * lo.base);
    }
}
