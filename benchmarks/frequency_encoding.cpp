/**
 * Frequency Encoding Benchmarks
 *
 * Forward cost (double, up to its scale cap) as the number of scales grows, and the per-point cost of
 * dispatching a 3-input encoding over a flat buffer in both call modes.
 */

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

#include "difflane/dispatch/dispatch.h"
#include "difflane/nn/frequency_encoding.h"
#include <benchmark/benchmark.h>

using namespace difflane;

namespace {

template <std::size_t NumScales>
void BM_EncodingForward(benchmark::State& state) {
    const nn::FrequencyEncoding<double, 3, NumScales> encoding;
    std::array<double, 3> input{0.125, -0.5, 0.75};

    for (auto _ : state) {
        benchmark::DoNotOptimize(input);
        auto output = encoding.forward(input);
        benchmark::DoNotOptimize(output);
    }
}

using Encoding = nn::FrequencyEncoding<double, 3, 8>;

DifferentiableBuffer<double> makePoints(std::size_t count) {
    std::vector<double> values(count * Encoding::kInputWidth);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<double>(i % 17) / 17.0 - 0.5;
    }
    return DifferentiableBuffer<double>(std::move(values));
}

void BM_EncodingDispatchPrimal(benchmark::State& state) {
    const Encoding encoding;
    const auto count = static_cast<std::size_t>(state.range(0));
    auto points = makePoints(count);
    DifferentiableBuffer<double> features;

    for (auto _ : state) {
        dispatch(encoding, CallMode::Primal, points, features);
        benchmark::DoNotOptimize(features.primal().data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

void BM_EncodingDispatchBackward(benchmark::State& state) {
    const Encoding encoding;
    const auto count = static_cast<std::size_t>(state.range(0));
    auto points = makePoints(count);
    DifferentiableBuffer<double> features;
    dispatch(encoding, CallMode::Primal, points, features);
    for (auto& g : features.grad()) {
        g = 1.0;
    }

    for (auto _ : state) {
        dispatch(encoding, CallMode::Backward, points, features);
        benchmark::DoNotOptimize(points.grad().data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

}  // namespace

BENCHMARK_TEMPLATE(BM_EncodingForward, 1);
BENCHMARK_TEMPLATE(BM_EncodingForward, 4);
BENCHMARK_TEMPLATE(BM_EncodingForward, 8);
BENCHMARK_TEMPLATE(BM_EncodingForward, 16);

BENCHMARK(BM_EncodingDispatchPrimal)->Arg(1024)->Arg(16384);
BENCHMARK(BM_EncodingDispatchBackward)->Arg(1024)->Arg(16384);
