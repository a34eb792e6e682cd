#include "catch2/catch.hpp"

#include "errol.h"
#include "ieee.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>

#include "scan_number.h"

//==================================================================================================
//
//==================================================================================================

static std::string GenerateDigitsString(double value, int& exponent)
{
    char digits[errol::DigitsBufferLength];
    const int num_digits = errol::GenerateDigits(digits, exponent, value);
    return std::string(digits, static_cast<size_t>(num_digits));
}

// Checks that the digits round-trip.
static void CheckDouble(double value)
{
    CAPTURE(value);

    int exponent = 0;
    const std::string digits = GenerateDigitsString(value, exponent);
    CAPTURE(digits);
    CAPTURE(exponent);

    REQUIRE(!digits.empty());
    CHECK(digits[0] != '0');

    const double parsed = ParseDouble("0." + digits + "e" + std::to_string(exponent));

    const uint64_t bits0 = ReinterpretBits<uint64_t>(value);
    const uint64_t bits1 = ReinterpretBits<uint64_t>(parsed);
    CAPTURE(bits0);
    CAPTURE(bits1);
    CHECK(bits0 == bits1);
}

inline void CheckDoubleBits(uint64_t bits)
{
    CheckDouble(ReinterpretBits<double>(bits));
}

// Checks that the digits round-trip and are as short as the expected (shortest) representation.
// The last digit may differ from the expected one.
static void CheckDouble(double value, const std::string& expected)
{
    CheckDouble(value);

    int exponent = 0;
    const std::string digits = GenerateDigitsString(value, exponent);

    const auto num_actual = FromDecimalDigits(digits.data(), static_cast<int>(digits.size()), exponent);
    const auto num_expected = ScanNumber(expected);

    CAPTURE(value);
    CAPTURE(expected);
    CAPTURE(num_actual.digits);
    CHECK(num_actual.digits.size() == num_expected.digits.size());
    CHECK(num_actual.exponent == num_expected.exponent);
}

static void CheckDoubleBits(uint64_t bits, const std::string& expected)
{
    CheckDouble(ReinterpretBits<double>(bits), expected);
}

// Checks the exact digits.
static void CheckDigits(double value, const std::string& expected_digits, int expected_exponent)
{
    CAPTURE(value);

    int exponent = 0;
    const std::string digits = GenerateDigitsString(value, exponent);
    CHECK(digits == expected_digits);
    CHECK(exponent == expected_exponent);
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("GenerateDigits")
{
    CheckDigits(18.51234334, "1851234334", 2);
    CheckDigits(0.23432e304, "23432", 304);
    CheckDigits(0.1, "1", 0);
    CheckDigits(1.0, "1", 1);
    CheckDigits(8.5, "85", 1);
    CheckDigits(1000.0, "1", 4);
    CheckDigits(6e-18, "6", -17);
    CheckDigits(5e-324, "5", -323);
    CheckDigits(1e-322, "1", -321);
    CheckDigits(2.225073858507201e-308, "2225073858507201", -307);
}

TEST_CASE("GenerateDigits - Long digit strings")
{
    // The digit loop runs to the maximum length for these.
    CheckDigits(0.1 + 0.2, "30000000000000004", 0);
    CheckDigits(1.0 / 3.0, "3333333333333333", 0);
    CheckDigits(2.0 / 3.0, "6666666666666666", 0);
    CheckDigits(2.2250738585072014e-308, "22250738585072014", -307);
    CheckDigits(1.7976931348623155e308, "17976931348623155", 309);
}

TEST_CASE("ToDigits")
{
    char buffer[errol::DigitsBufferLength];

    SECTION("zero")
    {
        const auto dec = errol::ToDigits(buffer, 0.0);
        CHECK(std::string(buffer, static_cast<size_t>(dec.length)) == "0");
        CHECK(dec.exponent == 1);
        CHECK(!dec.sign);

        const auto neg = errol::ToDigits(buffer, -0.0);
        CHECK(std::string(buffer, static_cast<size_t>(neg.length)) == "0");
        CHECK(neg.exponent == 1);
        CHECK(neg.sign);
    }

    SECTION("special values")
    {
        const auto nan = errol::ToDigits(buffer, std::numeric_limits<double>::quiet_NaN());
        CHECK(std::string(buffer, static_cast<size_t>(nan.length)) == "NaN");
        CHECK(nan.exponent == errol::SpecialExponent);
        CHECK(!nan.sign);

        const auto neg_nan = errol::ToDigits(buffer, -std::numeric_limits<double>::quiet_NaN());
        CHECK(std::string(buffer, static_cast<size_t>(neg_nan.length)) == "NaN");
        CHECK(neg_nan.sign);

        const auto inf = errol::ToDigits(buffer, std::numeric_limits<double>::infinity());
        CHECK(std::string(buffer, static_cast<size_t>(inf.length)) == "Inf");
        CHECK(inf.exponent == errol::SpecialExponent);
        CHECK(!inf.sign);

        const auto neg_inf = errol::ToDigits(buffer, -std::numeric_limits<double>::infinity());
        CHECK(std::string(buffer, static_cast<size_t>(neg_inf.length)) == "Inf");
        CHECK(neg_inf.exponent == errol::SpecialExponent);
        CHECK(neg_inf.sign);
    }

    SECTION("max")
    {
        const auto dec = errol::ToDigits(buffer, std::numeric_limits<double>::max());
        CHECK(std::string(buffer, static_cast<size_t>(dec.length)) == "17976931348623157");
        CHECK(dec.exponent == 309);
        CHECK(!dec.sign);

        const auto neg = errol::ToDigits(buffer, -std::numeric_limits<double>::max());
        CHECK(std::string(buffer, static_cast<size_t>(neg.length)) == "17976931348623157");
        CHECK(neg.exponent == 309);
        CHECK(neg.sign);
    }

    SECTION("sign")
    {
        const auto pos = errol::ToDigits(buffer, 18.51234334);
        const std::string pos_digits(buffer, static_cast<size_t>(pos.length));
        const auto neg = errol::ToDigits(buffer, -18.51234334);
        const std::string neg_digits(buffer, static_cast<size_t>(neg.length));

        CHECK(pos_digits == "1851234334");
        CHECK(neg_digits == pos_digits);
        CHECK(neg.exponent == pos.exponent);
        CHECK(!pos.sign);
        CHECK(neg.sign);
    }
}

TEST_CASE("Double")
{
    CheckDouble(MakeDouble(20, -1074), "1e-322");

    CheckDouble(MakeDouble(0,    0, 0x0000000000000001), "5e-324"                 ); // min denormal
    CheckDouble(MakeDouble(0,    0, 0x000FFFFFFFFFFFFF), "2.225073858507201e-308" ); // max denormal
    CheckDouble(MakeDouble(0,    1, 0x0000000000000000), "2.2250738585072014e-308"); // min normal
    CheckDouble(MakeDouble(0,    1, 0x0000000000000001), "2.225073858507202e-308" );
    CheckDouble(MakeDouble(0,    1, 0x000FFFFFFFFFFFFF), "4.4501477170144023e-308");
    CheckDouble(MakeDouble(0,    2, 0x0000000000000000), "4.450147717014403e-308" );
    CheckDouble(MakeDouble(0,    2, 0x0000000000000001), "4.450147717014404e-308" );
    CheckDouble(MakeDouble(0,    4, 0x0000000000000000), "1.7800590868057611e-307");
    CheckDouble(MakeDouble(0,    5, 0x0000000000000000), "3.5601181736115222e-307");
    CheckDouble(MakeDouble(0,    6, 0x0000000000000000), "7.120236347223045e-307" );
    CheckDouble(MakeDouble(0,   10, 0x0000000000000000), "1.1392378155556871e-305");
    CheckDouble(MakeDouble(0, 2046, 0x000FFFFFFFFFFFFE), "1.7976931348623155e+308");
}

TEST_CASE("Double - Subnormals")
{
    for (uint64_t significand = 1; significand <= 0x000FFFFFFFFFFFFF; significand = 3 * significand + 1)
    {
        CAPTURE(significand);
        CheckDouble(MakeDouble(0, 0, significand));
    }

    CheckDouble(MakeDouble(0, 0, 0x0000000000000002));
    CheckDouble(MakeDouble(0, 0, 0x0000000000000003));
    CheckDouble(MakeDouble(0, 0, 0x000FFFFFFFFFFFFE));
    CheckDouble(MakeDouble(0, 0, 0x0008000000000000));
}

TEST_CASE("Double - Boundaries")
{
    for (uint64_t e = 2; e < 2046; ++e)
    {
        CAPTURE(e);
        CheckDouble(MakeDouble(0, e-1, 0x000FFFFFFFFFFFFF));
        CheckDouble(MakeDouble(0, e,   0x0000000000000000));
        CheckDouble(MakeDouble(0, e,   0x0000000000000001));
    }
}

TEST_CASE("Double - Paxson, Kahan")
{
    // V. Paxson and W. Kahan, "A Program for Testing IEEE Binary-Decimal Conversion", manuscript, May 1991

    // Table 3: Stress Inputs for Converting 53-bit Binary to Decimal, < 1/2 ULP
    CheckDouble( MakeDouble(8511030020275656,  -342), "9.5e-88"                 );
    CheckDouble( MakeDouble(5201988407066741,  -824), "4.65e-233"               );
    CheckDouble( MakeDouble(6406892948269899,  +237), "1.415e+87"               );
    CheckDouble( MakeDouble(8431154198732492,   +72), "3.9815e+37"              );
    CheckDouble( MakeDouble(6475049196144587,   +99), "4.10405e+45"             );
    CheckDouble( MakeDouble(8274307542972842,  +726), "2.920845e+234"           );
    CheckDouble( MakeDouble(5381065484265332,  -456), "2.8919465e-122"          );
    CheckDouble( MakeDouble(6761728585499734, -1057), "4.37877185e-303"         );
    CheckDouble( MakeDouble(7976538478610756,  +376), "1.227701635e+129"        );
    CheckDouble( MakeDouble(5982403858958067,  +377), "1.8415524525e+129"       );
    CheckDouble( MakeDouble(5536995190630837,   +93), "5.48357443505e+43"       );
    CheckDouble( MakeDouble(7225450889282194,  +710), "3.891901811465e+229"     );
    CheckDouble( MakeDouble(7225450889282194,  +709), "1.9459509057325e+229"    );
    CheckDouble( MakeDouble(8703372741147379,  +117), "1.44609583816055e+51"    );
    CheckDouble( MakeDouble(8944262675275217, -1001), "4.173677474585315e-286"  );
    CheckDouble( MakeDouble(7459803696087692,  -707), "1.1079507728788885e-197" );
    CheckDouble( MakeDouble(6080469016670379,  -381), "1.234550136632744e-99"   );
    CheckDouble( MakeDouble(8385515147034757,  +721), "9.25031711960365e+232"   );
    CheckDouble( MakeDouble(7514216811389786,  -828), "4.19804715028489e-234"   );
    CheckDouble( MakeDouble(8397297803260511,  -345), "1.1716315319786511e-88"  );
    CheckDouble( MakeDouble(6733459239310543,  +202), "4.328100728446125e+76"   );
    CheckDouble( MakeDouble(8091450587292794,  -473), "3.317710118160031e-127"  );

    // Table 4: Stress Inputs for Converting 53-bit Binary to Decimal, > 1/2 ULP
    CheckDouble( MakeDouble(6567258882077402, +952), "2.5e+302"                );
    CheckDouble( MakeDouble(6712731423444934, +535), "7.55e+176"               );
    CheckDouble( MakeDouble(6712731423444934, +534), "3.775e+176"              );
    CheckDouble( MakeDouble(5298405411573037, -957), "4.3495e-273"             );
    CheckDouble( MakeDouble(5137311167659507, -144), "2.30365e-28"             );
    CheckDouble( MakeDouble(6722280709661868, +363), "1.263005e+125"           );
    CheckDouble( MakeDouble(5344436398034927, -169), "7.1422105e-36"           );
    CheckDouble( MakeDouble(8369123604277281, -853), "1.39345735e-241"         );
    CheckDouble( MakeDouble(8995822108487663, -780), "1.414634485e-219"        );
    CheckDouble( MakeDouble(8942832835564782, -383), "4.5392779195e-100"       );
    CheckDouble( MakeDouble(8942832835564782, -384), "2.26963895975e-100"      );
    CheckDouble( MakeDouble(8942832835564782, -385), "1.134819479875e-100"     );
    CheckDouble( MakeDouble(6965949469487146, -249), "7.7003665618895e-60"     );
    CheckDouble( MakeDouble(6965949469487146, -250), "3.85018328094475e-60"    );
    CheckDouble( MakeDouble(6965949469487146, -251), "1.925091640472375e-60"   );
    CheckDouble( MakeDouble(7487252720986826, +548), "6.8985865317742005e+180" );
    CheckDouble( MakeDouble(5592117679628511, +164), "1.3076622631878654e+65"  );
    CheckDouble( MakeDouble(8887055249355788, +665), "1.3605202075612124e+216" );
    CheckDouble( MakeDouble(6994187472632449, +690), "3.5928102174759597e+223" );
    CheckDouble( MakeDouble(8797576579012143, +588), "8.912519771248455e+192"  );
    CheckDouble( MakeDouble(7363326733505337, +272), "5.5876975736230114e+97"  );
    CheckDouble( MakeDouble(8549497411294502, -448), "1.1762578307285404e-119" );
}

TEST_CASE("Double - Regression")
{
    CheckDouble(1.5745340942675811e+257, "1.574534094267581e+257");
    CheckDouble(1.6521200219181297e-180, "1.6521200219181297e-180");
    CheckDouble(4.6663180925160944e-302, "4.6663180925160944e-302");

    CheckDouble(18776091678571.0 / 64.0);

    CheckDouble(2.0919495182368195e+19, "2.0919495182368195e+19");
    CheckDouble(2.6760179287532483e+19, "2.6760179287532483e+19");
    CheckDouble(3.2942957306323907e+19, "3.2942957306323907e+19");
    CheckDouble(3.9702293349085635e+19, "3.9702293349085635e+19");
    CheckDouble(4.0647939013152195e+19, "4.0647939013152195e+19");

    CheckDouble(1.8014398509481984E16, "1.8014398509481984E16");
    CheckDouble(1.8014398509481985E16, "1.8014398509481984E16");
}

TEST_CASE("Double - Code paths")
{
    CheckDoubleBits(0x40C3880000000000, "10000"                 );
    CheckDoubleBits(0x41324F8000000000, "1200000"               );
    CheckDoubleBits(0x0000000000000001, "5e-324"                );
    CheckDoubleBits(0x000FFFFFFFFFFFFF, "2.225073858507201e-308");
    CheckDoubleBits(0x2B70000000000000, "1.82877982605164e-99"  );
    CheckDoubleBits(0x3E13C42855500898, "1.1505466208671903e-9" );
    CheckDoubleBits(0x443E2A6B41CE4B23, "556458931337667200000" ); // exact integer
    CheckDoubleBits(0x404A8475527A8B30, "53.034830388866226"    );
    CheckDoubleBits(0x3F6141F8CE9A7906, "0.0021066531670178605" );
}

TEST_CASE("Double - Round to even")
{
    CheckDouble(1.00000000000000005, "1");
    CheckDouble(1.00000000000000015, "1.0000000000000002");
    CheckDouble(1.99999999999999985, "1.9999999999999998");
    CheckDouble(1.99999999999999995, "2");
    CheckDouble(1125899906842623.75, "1125899906842623.8");
    CheckDouble(1125899906842624.25, "1125899906842624.2");
    CheckDouble(562949953421312.25, "562949953421312.2");

    CheckDouble(2.20781707763671875, "22078170776367188e-16");
    CheckDouble(1.81835174560546875, "18183517456054688e-16");
    CheckDouble(3.94171905517578125, "39417190551757812e-16");
    CheckDouble(3.73860931396484375, "37386093139648438e-16");
    CheckDouble(3.96773529052734375, "39677352905273438e-16");
    CheckDouble(1.32802581787109375, "13280258178710938e-16");
    CheckDouble(3.92096710205078125, "39209671020507812e-16");
    CheckDouble(1.01523590087890625, "10152359008789062e-16");
    CheckDouble(1.33522796630859375, "13352279663085938e-16");
    CheckDouble(1.34452056884765625, "13445205688476562e-16");
    CheckDouble(2.87912750244140625, "28791275024414062e-16");
    CheckDouble(3.69583892822265625, "36958389282226562e-16");
    CheckDouble(1.84534454345703125, "18453445434570312e-16");
    CheckDouble(3.79395294189453125, "37939529418945312e-16");
    CheckDouble(3.21140289306640625, "32114028930664062e-16");
    CheckDouble(2.56597137451171875, "25659713745117188e-16");
    CheckDouble(0.96515655517578125, "9651565551757812e-16");
    CheckDouble(2.70000457763671875, "27000045776367188e-16");
    CheckDouble(0.76709747314453125, "7670974731445312e-16");
    CheckDouble(1.78044891357421875, "17804489135742188e-16");
    CheckDouble(2.62483978271484375, "26248397827148438e-16");
    CheckDouble(1.30529022216796875, "13052902221679688e-16");
    CheckDouble(3.83492279052734375, "38349227905273438e-16");
}

TEST_CASE("Double - Integers")
{
    CheckDouble(1.0, "1");
    CheckDouble(10.0, "10");
    CheckDouble(100.0, "100");
    CheckDouble(1000.0, "1000");
    CheckDouble(10000.0, "10000");
    CheckDouble(100000.0, "100000");
    CheckDouble(1000000.0, "1000000");
    CheckDouble(10000000.0, "10000000");
    CheckDouble(100000000.0, "100000000");
    CheckDouble(1000000000.0, "1000000000");
    CheckDouble(10000000000.0, "10000000000");
    CheckDouble(100000000000.0, "100000000000");
    CheckDouble(1000000000000.0, "1000000000000");
    CheckDouble(10000000000000.0, "10000000000000");
    CheckDouble(100000000000000.0, "100000000000000");
    CheckDouble(1000000000000000.0, "1000000000000000");
    CheckDouble(9007199254740000.0, "9007199254740000");
    CheckDouble(9007199254740992.0, "9007199254740992");
    CheckDouble(1e+22, "1e+22");
    CheckDouble(1e+23, "1e+23");
}

TEST_CASE("Double - Large integers")
{
    CheckDigits(9007199254740992.0 * 2, "18014398509481984", 17);
    CheckDigits(1e+22, "1", 23);
    CheckDigits(1e+23, "1", 24);
    CheckDigits(0x1p100, "12676506002282294", 31);

    // Every power of two in [2^53, 2^125).
    for (int e = 53; e < 125; ++e)
    {
        CAPTURE(e);
        CheckDouble(std::ldexp(1.0, e));
        CheckDouble(std::ldexp(1.0, e) * 1.5);
        CheckDouble(errol::IEEE<double>(std::ldexp(1.0, e)).PrevValue());
    }
}

TEST_CASE("Double - Looks like pow5")
{
    CheckDoubleBits(0x4830F0CF064DD592, "5.764607523034235e+39");
    CheckDoubleBits(0x4840F0CF064DD592, "1.152921504606847e+40");
    CheckDoubleBits(0x4850F0CF064DD592, "2.305843009213694e+40");
}

TEST_CASE("Double - Random")
{
    std::mt19937_64 random(0x5EED);

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = random() & 0x7FFFFFFFFFFFFFFF;
        const errol::IEEE<double> v(bits);
        if (!v.IsFinite() || v.IsZero() || v.Value() == std::numeric_limits<double>::max())
            continue;

        CheckDoubleBits(bits);
    }
}
