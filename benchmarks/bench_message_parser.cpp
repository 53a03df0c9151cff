#include <benchmark/benchmark.h>
#include "aevo/message_parser.hpp"
#include "dydx/message_parser.hpp"
#include "normalizer/event_normalizer.hpp"

#include <string>

using namespace crossbook;

namespace {

std::string dydx_snapshot(std::size_t levels) {
    std::string bids;
    std::string asks;
    for (std::size_t i = 0; i < levels; ++i) {
        const char* sep = i == 0 ? "" : ",";
        bids += sep + std::string(R"({"price":")") + std::to_string(42150 - i) + R"(.5","size":"0.125"})";
        asks += sep + std::string(R"({"price":")") + std::to_string(42151 + i) + R"(.5","size":"0.125"})";
    }
    return R"({"type":"subscribed","connection_id":"c","message_id":1,"channel":"v4_orderbook",)"
           R"("id":"BTC-USD","contents":{"bids":[)" + bids + R"(],"asks":[)" + asks + "]}}";
}

std::string aevo_snapshot(std::size_t levels) {
    std::string bids;
    std::string asks;
    for (std::size_t i = 0; i < levels; ++i) {
        const char* sep = i == 0 ? "" : ",";
        bids += sep + std::string(R"([")") + std::to_string(42150 - i) + R"(","1.5","0.1"])";
        asks += sep + std::string(R"([")") + std::to_string(42151 + i) + R"(","1.5","0.1"])";
    }
    return R"({"channel":"orderbook:BTC-PERP","data":{"type":"snapshot","instrument_id":"1",)"
           R"("instrument_name":"BTC-PERP","bids":[)" + bids + R"(],"asks":[)" + asks +
           R"(],"last_updated":"1700000000000000000","checksum":"1"}})";
}

const std::string kDydxDelta =
    R"({"type":"channel_data","connection_id":"c","message_id":7,"id":"BTC-USD",)"
    R"("channel":"v4_orderbook","version":"1.0.0","contents":{"bids":[["42150.5","0"]],)"
    R"("asks":[["42151","2.25"]]}})";

const std::string kAevoUpdate =
    R"({"channel":"orderbook:BTC-PERP","data":{"type":"update","bids":[["42150","1.5","0.1"]],)"
    R"("asks":[],"last_updated":"1700000000000000000","checksum":"2"}})";

}  // namespace

// Benchmark parsing a dYdX snapshot with varying depth
static void BM_DydxParseSnapshot(benchmark::State& state) {
    auto levels = static_cast<std::size_t>(state.range(0));
    auto json = dydx_snapshot(levels);

    for (auto _ : state) {
        auto result = dydx::MessageParser::parse(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(json.size()));
}
BENCHMARK(BM_DydxParseSnapshot)->Range(10, 1000);

// Benchmark parsing a typical dYdX delta
static void BM_DydxParseDelta(benchmark::State& state) {
    for (auto _ : state) {
        auto result = dydx::MessageParser::parse(kDydxDelta);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(kDydxDelta.size()));
}
BENCHMARK(BM_DydxParseDelta);

// Benchmark parsing an Aevo snapshot with varying depth
static void BM_AevoParseSnapshot(benchmark::State& state) {
    auto levels = static_cast<std::size_t>(state.range(0));
    auto json = aevo_snapshot(levels);

    for (auto _ : state) {
        auto result = aevo::MessageParser::parse(json);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(json.size()));
}
BENCHMARK(BM_AevoParseSnapshot)->Range(10, 1000);

// Benchmark the full parse + normalize path for one Aevo update
static void BM_AevoParseAndNormalize(benchmark::State& state) {
    for (auto _ : state) {
        auto result = aevo::MessageParser::parse(kAevoUpdate);
        if (result.is_ok()) {
            if (const auto* update = std::get_if<aevo::Update>(&result.value())) {
                benchmark::DoNotOptimize(normalizer::to_events(*update));
            }
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AevoParseAndNormalize);
