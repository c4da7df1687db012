// bench/bench_fixed.cpp — Benchmarks for fixed-point arithmetic, math kernels and text output.

#include <benchmark/benchmark.h>

#include <fxpoint/fxpoint.hpp>

#include <string>

namespace {

using fxpoint::Format;
using fxpoint::Number;

static Format bench_format(const benchmark::State& state) {
    return Format(static_cast<int>(state.range(0)));
}

static void BM_Multiply(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number lhs = fmt.from_rational(22, 7);
    const Number rhs = fmt.from_rational(-355, 113);
    for (auto _ : state) {
        auto product = lhs * rhs;
        benchmark::DoNotOptimize(product.scaled_value());
    }
}
BENCHMARK(BM_Multiply)->Arg(64)->Arg(256)->Arg(4096);

static void BM_Divide(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number lhs = fmt.from_int(1);
    const Number rhs = fmt.from_rational(355, 113);
    for (auto _ : state) {
        auto quotient = lhs / rhs;
        benchmark::DoNotOptimize(quotient.scaled_value());
    }
}
BENCHMARK(BM_Divide)->Arg(64)->Arg(256)->Arg(4096);

static void BM_Sqrt(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number two = fmt.from_int(2);
    for (auto _ : state) {
        auto root = two.sqrt();
        benchmark::DoNotOptimize(root.scaled_value());
    }
}
BENCHMARK(BM_Sqrt)->Arg(64)->Arg(256)->Arg(4096);

static void BM_Exp(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number x = fmt.from_rational(7, 3);
    (void)fmt.ln2();
    for (auto _ : state) {
        auto value = x.exp();
        benchmark::DoNotOptimize(value.scaled_value());
    }
}
BENCHMARK(BM_Exp)->Arg(64)->Arg(256)->Arg(1024);

static void BM_Ln(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number x = fmt.from_int(10);
    (void)fmt.ln2();
    for (auto _ : state) {
        auto value = x.ln();
        benchmark::DoNotOptimize(value.scaled_value());
    }
}
BENCHMARK(BM_Ln)->Arg(64)->Arg(256)->Arg(1024);

static void BM_SinCos(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number x = fmt.from_rational(1000, 7);
    (void)fmt.pi();
    for (auto _ : state) {
        auto [sine, cosine] = x.sincos();
        benchmark::DoNotOptimize(sine.scaled_value());
        benchmark::DoNotOptimize(cosine.scaled_value());
    }
}
BENCHMARK(BM_SinCos)->Arg(64)->Arg(256)->Arg(1024);

static void BM_Atan(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number x = fmt.from_rational(3, 4);
    for (auto _ : state) {
        auto value = x.atan();
        benchmark::DoNotOptimize(value.scaled_value());
    }
}
BENCHMARK(BM_Atan)->Arg(64)->Arg(256)->Arg(1024);

static void BM_PowFractional(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number base = fmt.from_rational(3, 2);
    const Number exponent = fmt.from_rational(5, 4);
    (void)fmt.ln2();
    for (auto _ : state) {
        auto value = base.pow(exponent);
        benchmark::DoNotOptimize(value.scaled_value());
    }
}
BENCHMARK(BM_PowFractional)->Arg(64)->Arg(256);

// Fresh Format per iteration so every call computes pi from scratch.
static void BM_PiUncached(benchmark::State& state) {
    const int bits = static_cast<int>(state.range(0));
    for (auto _ : state) {
        const Format fmt(bits);
        auto pi = fmt.pi();
        benchmark::DoNotOptimize(pi.scaled_value());
    }
}
BENCHMARK(BM_PiUncached)->Arg(256)->Arg(4096)->Arg(16384);

static void BM_PiCached(benchmark::State& state) {
    const Format fmt = bench_format(state);
    (void)fmt.pi();
    for (auto _ : state) {
        auto pi = fmt.pi();
        benchmark::DoNotOptimize(pi.scaled_value());
    }
}
BENCHMARK(BM_PiCached)->Arg(256)->Arg(4096)->Arg(16384);

static void BM_DecimalString(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const Number value = fmt.from_rational(-22, 7);
    for (auto _ : state) {
        auto text = value.to_decimal_string();
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_DecimalString)->Arg(64)->Arg(1024);

static void BM_ParseDecimal(benchmark::State& state) {
    const Format fmt = bench_format(state);
    const std::string text = fmt.from_rational(-22, 7).to_decimal_string();
    for (auto _ : state) {
        auto value = fmt.from_string(text);
        benchmark::DoNotOptimize(value.scaled_value());
    }
}
BENCHMARK(BM_ParseDecimal)->Arg(64)->Arg(1024);

// Bounded Q16.16 iteration of the logistic map x <- r x (1 - x).
static void BM_LogisticMap(benchmark::State& state) {
    const Format fmt = fxpoint::make_format(16, 16);
    const Number r = fmt.from_rational(39, 10);
    const Number one = fmt.one();
    for (auto _ : state) {
        Number x = fmt.from_rational(1, 3);
        for (int step = 0; step < 64; ++step) {
            x = r * x * (one - x);
        }
        benchmark::DoNotOptimize(x.scaled_value());
    }
}
BENCHMARK(BM_LogisticMap);

} // namespace

BENCHMARK_MAIN();
