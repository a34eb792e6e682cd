// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

namespace errol {

//==================================================================================================
// Shortest round-trip double-to-decimal conversion (Errol).
//
// References:
//
// [1]  Andrysco, Jhala, Lerner, "Printing Floating-Point Numbers: A Faster, Always Correct Method",
//      Proceedings of the 43rd Annual ACM SIGPLAN-SIGACT Symposium on Principles of Programming
//      Languages, POPL 2016
//==================================================================================================

// Capacity of the digit buffer passed to GenerateDigits and ToDigits.
constexpr int DigitsBufferLength = 512;

// Decimal exponent reported by ToDigits for infinities and NaNs.
constexpr int SpecialExponent = 0x7000;

// int num_digits = GenerateDigits(digits, exponent, value);
//
// Computes the shortest digit string d[0]d[1]...d[n-1] such that 0.d[0]d[1]...d[n-1] * 10^exponent
// rounds (to nearest, ties to even) to the given value.
//
// The digits are stored as ASCII characters '0'...'9'. The output is _not_ null-terminated.
// Returns the number of digits.
//
// PRE: value must be finite and strictly positive.
// PRE: value must be less than the largest finite double.
// PRE: digits must be large enough, i.e. >= DigitsBufferLength.
int GenerateDigits(char* digits, int& exponent, double value);

struct DecimalDigits
{
    int length;
    int exponent;
    bool sign;
};

// DecimalDigits dec = ToDigits(buffer, value);
//
// Like GenerateDigits, but accepts any double. The sign is reported separately
// and the digits describe the absolute value.
//
//  - NaN and infinity store "NaN" and "Inf", and set exponent = SpecialExponent.
//  - Zero stores "0" with exponent 1.
//
// PRE: buffer must be large enough, i.e. >= DigitsBufferLength.
DecimalDigits ToDigits(char* buffer, double value);

// char* output_end = Dtoa(buffer, value, precision);
//
// Converts the given double-precision number into decimal form and stores the result in the given
// buffer, using at most precision significant digits.
//
// The buffer must be large enough, i.e. >= DtoaMinBufferLength.
// The output format is similar to printf("%g"), except that excess digits are
// cut off instead of rounded. Precision is clamped to [1, MaxPrecision].
// The output is _not_ null-terminated.

constexpr int DtoaMinBufferLength = 32;
constexpr int DefaultPrecision = 6;
constexpr int MaxPrecision = 17;

char* Dtoa(char* buffer, double value, int precision = DefaultPrecision);

} // namespace errol
