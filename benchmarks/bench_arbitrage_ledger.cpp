#include <benchmark/benchmark.h>
#include "arbitrage/arbitrage_ledger.hpp"
#include "core/types.hpp"

using namespace crossbook;

namespace {

using Ledger = ArbitrageLedger<Venue>;

constexpr std::int64_t kTick = 50000000;  // 0.5 in raw units

Price price_at(std::int64_t base, std::int64_t offset) {
    return Price::from_raw((base + offset) * kTick);
}

// Two interleaved books that never cross: dYdX quotes below Aevo
void fill(Ledger& ledger, std::size_t levels) {
    const auto qty = Quantity::parse("1.5");
    for (std::size_t i = 0; i < levels; ++i) {
        auto offset = static_cast<std::int64_t>(i);
        (void)ledger.buy(Venue::Dydx, price_at(80000, -offset), qty);
        (void)ledger.sell(Venue::Dydx, price_at(80001, offset), qty);
        (void)ledger.buy(Venue::Aevo, price_at(80000, -offset), qty);
        (void)ledger.sell(Venue::Aevo, price_at(80001, offset), qty);
    }
}

}  // namespace

// Benchmark inserting new levels that do not cross
static void BM_LedgerInsert(benchmark::State& state) {
    auto levels = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        Ledger ledger;
        fill(ledger, levels);
        benchmark::DoNotOptimize(ledger.bid_levels());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(levels) * 4);
}
BENCHMARK(BM_LedgerInsert)->Range(10, 1000);

// Benchmark overwriting the quantity of an existing entry
static void BM_LedgerUpdateExisting(benchmark::State& state) {
    Ledger ledger;
    fill(ledger, 100);
    const auto price = price_at(80000, -10);
    const auto small = Quantity::parse("0.1");
    const auto large = Quantity::parse("2.0");
    bool flip = false;

    for (auto _ : state) {
        flip = !flip;
        benchmark::DoNotOptimize(ledger.buy(Venue::Dydx, price, flip ? small : large));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LedgerUpdateExisting);

// Benchmark add then remove of one entry at the top of book
static void BM_LedgerAddRemove(benchmark::State& state) {
    Ledger ledger;
    fill(ledger, 100);
    const auto price = price_at(80000, 1);
    const auto qty = Quantity::parse("0.25");

    for (auto _ : state) {
        benchmark::DoNotOptimize(ledger.buy(Venue::Aevo, price, qty));
        benchmark::DoNotOptimize(ledger.buy(Venue::Aevo, price, Quantity{}));
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_LedgerAddRemove);

// Benchmark an aggressive order crossing many resting levels
static void BM_LedgerCrossingScan(benchmark::State& state) {
    auto max_crossings = static_cast<std::size_t>(state.range(0));
    Ledger ledger(max_crossings);
    const auto qty = Quantity::parse("1");
    for (std::int64_t i = 0; i < 500; ++i) {
        (void)ledger.sell(Venue::Aevo, price_at(80000, i), qty);
    }
    const auto through = price_at(80000, 1000);

    for (auto _ : state) {
        auto result = ledger.buy(Venue::Dydx, through, qty);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LedgerCrossingScan)->Arg(1)->Arg(16)->Arg(0);

// Benchmark top of book queries
static void BM_LedgerBestPrices(benchmark::State& state) {
    Ledger ledger;
    fill(ledger, 100);

    for (auto _ : state) {
        benchmark::DoNotOptimize(ledger.best_bid());
        benchmark::DoNotOptimize(ledger.best_ask());
    }
}
BENCHMARK(BM_LedgerBestPrices);
