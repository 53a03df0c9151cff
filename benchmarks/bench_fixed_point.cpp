#include <benchmark/benchmark.h>
#include "core/types.hpp"

#include <string>

using namespace crossbook;

// Benchmark parsing wire decimals of typical length
static void BM_FixedPointParse(benchmark::State& state) {
    const std::string text = "42150.12345678";

    for (auto _ : state) {
        benchmark::DoNotOptimize(Price::parse(text));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FixedPointParse);

// Benchmark parsing short integer quantities
static void BM_FixedPointParseShort(benchmark::State& state) {
    const std::string text = "3";

    for (auto _ : state) {
        benchmark::DoNotOptimize(Quantity::parse(text));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FixedPointParseShort);

// Benchmark exact rendering back to decimal text
static void BM_FixedPointToString(benchmark::State& state) {
    const auto price = Price::parse("42150.5");

    for (auto _ : state) {
        benchmark::DoNotOptimize(price.to_string());
    }
}
BENCHMARK(BM_FixedPointToString);

// Benchmark spread x quantity accumulation as done per opportunity
static void BM_FixedPointBalanceUpdate(benchmark::State& state) {
    const auto spread = Price::parse("12.75");
    const auto matched = Quantity::parse("0.0375");
    Notional balance;

    for (auto _ : state) {
        balance += spread * matched;
        benchmark::DoNotOptimize(balance);
    }
}
BENCHMARK(BM_FixedPointBalanceUpdate);
