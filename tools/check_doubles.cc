#include "errol.h"
#include "ieee.h"

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"

#include "double-conversion/double-conversion.h"

#include <cstdint>
#include <cstdio>
#include <limits>
#include <random>
#include <string>

ABSL_FLAG(uint32_t, seed, 0, "Seed of the random significand generator");
ABSL_FLAG(int, samples_per_exponent, 1 << 15, "Number of random significands checked per exponent");
ABSL_FLAG(int, min_biased_exponent, 0, "First biased exponent to check");
ABSL_FLAG(int, max_biased_exponent, 2046, "Last biased exponent to check");
ABSL_FLAG(bool, stop_on_failure, false, "Stop after the first exponent with a failure");

using Double = errol::IEEE<double>;

static double StrtodDoubleConversion(const char* buf, int len)
{
    double_conversion::StringToDoubleConverter s2d(0, 0.0, 0.0, "Inf", "NaN");
    int processed_characters_count = 0;
    return s2d.StringToDouble(buf, len, &processed_characters_count);
}

// Returns the shortest digits and the exponent, such that value = 0.digits * 10^exponent.
static std::string DtoaDoubleConversion(double value, int& exponent)
{
    char buf[double_conversion::DoubleToStringConverter::kBase10MaximalLength + 1];
    bool sign = false;
    int length = 0;
    int point = 0;
    double_conversion::DoubleToStringConverter::DoubleToAscii(
        value, double_conversion::DoubleToStringConverter::SHORTEST, 0, buf, static_cast<int>(sizeof(buf)), &sign, &length, &point);

    exponent = point;
    return std::string(buf, static_cast<size_t>(length));
}

int main(int argc, char** argv)
{
    absl::ParseCommandLine(argc, argv);

    const int samples_per_exponent = absl::GetFlag(FLAGS_samples_per_exponent);
    const int min_exponent = absl::GetFlag(FLAGS_min_biased_exponent);
    const int max_exponent = absl::GetFlag(FLAGS_max_biased_exponent);
    const bool stop_on_failure = absl::GetFlag(FLAGS_stop_on_failure);

    if (samples_per_exponent <= 0 || min_exponent < 0 || max_exponent > 2046 || min_exponent > max_exponent)
    {
        printf("invalid arguments: need samples_per_exponent > 0 and 0 <= min_biased_exponent <= max_biased_exponent <= 2046\n");
        return 2;
    }

    std::mt19937 random(absl::GetFlag(FLAGS_seed));
    std::uniform_int_distribution<uint64_t> gen(0, Double::SignificandMask);

    uint64_t num_checked = 0;
    uint64_t num_failed  = 0;
    uint64_t num_optimal = 0;
    uint64_t num_short   = 0;

    for (int e = min_exponent; e <= max_exponent; ++e)
    {
        uint32_t curr_num_checked = 0;
        uint32_t curr_num_failed  = 0;
        uint32_t curr_num_optimal = 0;
        uint32_t curr_num_short   = 0;

        printf("e = %4d ... ", e);

        for (int i = 0; i < samples_per_exponent; ++i)
        {
            const uint64_t bits = (static_cast<uint64_t>(e) << (Double::SignificandSize - 1)) | gen(random);
            const Double v(bits);
            if (v.IsZero() || v.Value() == std::numeric_limits<double>::max())
                continue;

            ++curr_num_checked;

            char digits[errol::DigitsBufferLength];
            int exponent = 0;
            const int num_digits = errol::GenerateDigits(digits, exponent, v.Value());

            const std::string actual = "0." + std::string(digits, static_cast<size_t>(num_digits)) + "e" + std::to_string(exponent);
            const double value_out = StrtodDoubleConversion(actual.data(), static_cast<int>(actual.size()));

            int expected_exponent = 0;
            const std::string expected = DtoaDoubleConversion(v.Value(), expected_exponent);

            if (Double(value_out).bits != bits)
            {
                printf("\nFAIL: 0x%016llX [actual = %s] [expected = 0.%se%d]\n",
                    static_cast<unsigned long long>(bits), actual.c_str(), expected.c_str(), expected_exponent);
                ++curr_num_failed;
                continue;
            }

            if (num_digits == static_cast<int>(expected.size()))
                ++curr_num_short;
            if (num_digits == static_cast<int>(expected.size()) && exponent == expected_exponent && expected.compare(0, expected.size(), digits, static_cast<size_t>(num_digits)) == 0)
                ++curr_num_optimal;
        }

        const uint32_t curr_not_short = curr_num_checked - curr_num_short;
        const uint32_t curr_not_optimal = curr_num_checked - curr_num_optimal;

        printf("failed: %10u, not optimal: %7.2f%% (%10u), not short: %7.2f%% (%10u)\n",
            curr_num_failed,
            curr_num_checked == 0 ? 0.0 : 100.0 * static_cast<double>(curr_not_optimal) / curr_num_checked,
            curr_not_optimal,
            curr_num_checked == 0 ? 0.0 : 100.0 * static_cast<double>(curr_not_short) / curr_num_checked,
            curr_not_short);

        num_checked += curr_num_checked;
        num_failed  += curr_num_failed;
        num_optimal += curr_num_optimal;
        num_short   += curr_num_short;

        if (stop_on_failure && curr_num_failed != 0)
            break;
    }

    printf("done.\n");
    printf("checked: %llu\n", static_cast<unsigned long long>(num_checked));
    printf("failed:  %llu\n", static_cast<unsigned long long>(num_failed));
    if (num_checked != 0)
    {
        printf("optimal: %7.2f%% (%llu)\n", 100.0 * static_cast<double>(num_optimal) / static_cast<double>(num_checked), static_cast<unsigned long long>(num_optimal));
        printf("short:   %7.2f%% (%llu)\n", 100.0 * static_cast<double>(num_short) / static_cast<double>(num_checked), static_cast<unsigned long long>(num_short));
    }

    return num_failed == 0 ? 0 : 1;
}
