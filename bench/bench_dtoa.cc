#include "benchmark/benchmark.h"

#include "errol.h"

#include <cassert>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include <algorithm>
#include <random>
#include <string>
#include <utility>
#include <vector>

#define BENCH_STD_PRINTF()      1
#define BENCH_STD_CHARCONV()    1

//==================================================================================================
//
//==================================================================================================

static constexpr int BufSize = 64;
static constexpr int NumFloats = 1 << 13;

struct D2S_Errol
{
    static char const* Name() { return "errol"; }
    char* operator()(char* buf, int /*buflen*/, double f) const { return errol::Dtoa(buf, f); }
};

struct D2S_ErrolMaxPrecision
{
    static char const* Name() { return "errol 17"; }
    char* operator()(char* buf, int /*buflen*/, double f) const { return errol::Dtoa(buf, f, errol::MaxPrecision); }
};

struct D2S_ErrolDigits
{
    static char const* Name() { return "errol digits"; }
    char* operator()(char* /*buf*/, int /*buflen*/, double f) const
    {
        // GenerateDigits needs a larger buffer than the other converters.
        static thread_local char digits[errol::DigitsBufferLength];
        int exponent;
        const int num_digits = errol::GenerateDigits(digits, exponent, f);
        return digits + num_digits;
    }
};

#if BENCH_STD_PRINTF()
struct D2S_Printf
{
    static char const* Name() { return "std::printf"; }
    char* operator()(char* buf, int buflen, double f) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%g", f); }
};
#endif

#if BENCH_STD_CHARCONV()
struct D2S_Charconv
{
    static char const* Name() { return "std::to_chars"; }
    char* operator()(char* buf, int buflen, double f) const { return std::to_chars(buf, buf + buflen, f).ptr; }
};
#endif

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source const& source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

template <typename ...Args>
static inline std::string StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return buf;
}

template <typename D2S>
static inline void BenchIt(benchmark::State& state, std::vector<double> const& numbers)
{
    D2S d2s;

    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        char buffer[BufSize];
        char* end = d2s(buffer, BufSize, numbers[index]);
        benchmark::DoNotOptimize(end);
        sum += static_cast<unsigned char>(end[-1]);
        index = (index + 1) & (NumFloats - 1);
    }

    benchmark::DoNotOptimize(sum);
}

template <typename D2S>
static inline void RegisterBenchmark(std::string const& name, std::vector<double> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(StrPrintf("%-14s %s", D2S::Name(), name.c_str()).c_str(), BenchIt<D2S>, numbers);

    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

static inline void RegisterBenchmarks(std::string const& name, std::vector<double> const& numbers)
{
    RegisterBenchmark<D2S_Errol>(name, numbers);
    RegisterBenchmark<D2S_ErrolMaxPrecision>(name, numbers);
    RegisterBenchmark<D2S_ErrolDigits>(name, numbers);
#if BENCH_STD_PRINTF()
    RegisterBenchmark<D2S_Printf>(name, numbers);
#endif
#if BENCH_STD_CHARCONV()
    RegisterBenchmark<D2S_Charconv>(name, numbers);
#endif
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static inline void Register_RandomBits()
{
    std::vector<double> numbers(NumFloats);

    // Positive, finite and less than the largest double.
    std::uniform_int_distribution<uint64_t> gen(1, 0x7FEFFFFFFFFFFFFFull - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<double>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

static inline void Register_Uniform(double low, double high)
{
    std::vector<double> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] {
        double v = gen(rng);
        return v > 0.0 ? v : high;
    });

    RegisterBenchmarks(StrPrintf("Uniform %.1g/%.1g", low, high), numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

// Random numbers with the given number of significant digits, scaled by 10^e10.
static inline void Register_Digits(int digits, int e10)
{
    assert(digits >= 1);
    assert(digits <= 16);

    std::vector<double> numbers(NumFloats);

    int64_t min_value = 1;
    for (int i = 1; i < digits; ++i)
        min_value *= 10;

    std::uniform_int_distribution<int64_t> gen(min_value, 10 * min_value - 1);
    const double scale = std::pow(10.0, e10);

    std::generate(numbers.begin(), numbers.end(), [&] {
        int64_t n = gen(rng);
        if (n % 10 == 0)
            n |= 1;
        return static_cast<double>(n) * scale;
    });

    RegisterBenchmarks(StrPrintf("%2d digits e%+d", digits, e10), numbers);
}

// Integers in [2^53, 2^64), which take the exact integer path.
static inline void Register_LargeIntegers()
{
    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen(uint64_t{1} << 53, UINT64_MAX);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<double>(gen(rng)); });

    RegisterBenchmarks("Large integers", numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

    Register_RandomBits();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(0.0, 1.0e+308);
    Register_Uniform(1.0, 2.0);
    Register_LargeIntegers();

    for (int d = 1; d <= 16; d += 3)
    {
        Register_Digits(d, -8);
        Register_Digits(d, 0);
        Register_Digits(d, 8);
    }

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
