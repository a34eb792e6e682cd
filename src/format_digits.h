// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <type_traits>

#ifndef ERROL_ASSERT
#define ERROL_ASSERT(X) assert(X)
#endif

namespace errol {

// Enough for the 20 digits of UINT64_MAX, or a sign and the 19 digits of INT64_MIN.
constexpr int IntegerMinBufferLength = 20;

namespace impl {

inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    ERROL_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

inline char* Utoa_4Digits(char* buf, uint32_t digits)
{
    ERROL_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

inline char* Utoa_8Digits(char* buf, uint32_t digits)
{
    ERROL_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

inline int DecimalLength(uint32_t v)
{
    ERROL_ASSERT(v <= 99999999);

    if (v >= 10000000) { return 8; }
    if (v >= 1000000) { return 7; }
    if (v >= 100000) { return 6; }
    if (v >= 10000) { return 5; }
    if (v >= 1000) { return 4; }
    if (v >= 100) { return 3; }
    if (v >= 10) { return 2; }
    return 1;
}

inline void PrintDecimalDigits(char* buf, uint32_t output, int output_length)
{
    while (output >= 10000)
    {
        ERROL_ASSERT(output_length > 4);
        const uint32_t q = output / 10000;
        const uint32_t r = output % 10000;
        output = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output >= 100)
    {
        ERROL_ASSERT(output_length > 2);
        const uint32_t q = output / 100;
        const uint32_t r = output % 100;
        output = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output >= 10)
    {
        ERROL_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output);
    }
    else
    {
        ERROL_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output);
    }
}

} // namespace impl

// Writes the decimal representation of value into buffer and returns a pointer
// past the last character written. The output is _not_ null-terminated.
// PRE: The buffer holds at least IntegerMinBufferLength characters.
template <typename Int>
inline char* IntegerToChars(char* buffer, Int value)
{
    static_assert(std::is_integral<Int>::value && !std::is_same<Int, bool>::value, "integer type required");
    static_assert(sizeof(Int) <= sizeof(uint64_t), "integers wider than 64 bits are not supported");

    uint64_t n = static_cast<uint64_t>(value);
    if (std::is_signed<Int>::value && value < Int{0})
    {
        *buffer++ = '-';
        n = 0 - n;
    }

    // We prefer 32-bit operations, even on 64-bit platforms.
    // Cut off 8 digits at a time until the rest fits into uint32_t. These chunks
    // are not the most significant part and keep their leading zeros.
    char scratch[IntegerMinBufferLength];
    char* first = scratch + IntegerMinBufferLength;

    while (n >= 100000000)
    {
        const uint64_t q = n / 100000000;
        const uint32_t r = static_cast<uint32_t>(n % 100000000);
        n = q;
        first -= 8;
        impl::Utoa_8Digits(first, r);
    }

    const uint32_t leading = static_cast<uint32_t>(n);
    const int leading_length = impl::DecimalLength(leading);
    first -= leading_length;
    impl::PrintDecimalDigits(first, leading, leading_length);

    const auto length = static_cast<size_t>(scratch + IntegerMinBufferLength - first);
    std::memcpy(buffer, first, length);
    return buffer + length;
}

// Print 0.digits * 10^decimal_exponent in a form similar to printf("%g").
//
// At most precision significant digits are printed. Excess digits are cut off
// (not rounded) and trailing zeros are removed, keeping at least one digit.
// Scientific notation is used iff decimal_exponent <= -4 or decimal_exponent > precision.
//
// PRE: 1 <= num_digits, digits[0] != '0' unless the value is zero
// PRE: 1 <= precision <= 17
// PRE: sizeof(buffer) >= 24
inline char* FormatDigits(char* buffer, const char* digits, int num_digits, int decimal_exponent, int precision)
{
    ERROL_ASSERT(num_digits >= 1);
    ERROL_ASSERT(precision >= 1);
    ERROL_ASSERT(precision <= 17);
    ERROL_ASSERT(decimal_exponent >= -999);
    ERROL_ASSERT(decimal_exponent <=  999);

    int length = num_digits < precision ? num_digits : precision;
    while (length > 1 && digits[length - 1] == '0')
    {
        --length;
    }

    const bool use_scientific = decimal_exponent <= -4 || decimal_exponent > precision;

    if (use_scientific)
    {
        // d.igitse+123
        *buffer++ = digits[0];
        if (length > 1)
        {
            *buffer++ = '.';
            std::memcpy(buffer, digits + 1, static_cast<size_t>(length - 1));
            buffer += length - 1;
        }

        const int scientific_exponent = decimal_exponent - 1;
        std::memcpy(buffer, scientific_exponent < 0 ? "e-" : "e+", 2);
        buffer += 2;

        const uint32_t k = static_cast<uint32_t>(scientific_exponent < 0 ? -scientific_exponent : scientific_exponent);
        if (k < 100)
        {
            buffer = impl::Utoa_2Digits(buffer, k);
        }
        else
        {
            const uint32_t r = k % 10;
            const uint32_t q = k / 10;
            buffer = impl::Utoa_2Digits(buffer, q);
            *buffer++ = static_cast<char>('0' + r);
        }
    }
    else if (decimal_exponent <= 0)
    {
        // 0.[000]digits
        // -3 <= decimal_exponent <= 0
        std::memcpy(buffer, "0.000", 5);
        buffer += 2 + (-decimal_exponent);
        std::memcpy(buffer, digits, static_cast<size_t>(length));
        buffer += length;
    }
    else if (decimal_exponent >= length)
    {
        // digits[000]
        // decimal_exponent <= precision <= 17, no decimal point follows.
        std::memcpy(buffer, digits, static_cast<size_t>(length));
        std::memset(buffer + length, '0', static_cast<size_t>(decimal_exponent - length));
        buffer += decimal_exponent;
    }
    else
    {
        // dig.its
        std::memcpy(buffer, digits, static_cast<size_t>(decimal_exponent));
        buffer[decimal_exponent] = '.';
        std::memcpy(buffer + decimal_exponent + 1, digits + decimal_exponent, static_cast<size_t>(length - decimal_exponent));
        buffer += length + 1;
    }

    return buffer;
}

} // namespace errol
