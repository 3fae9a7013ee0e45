/**
 * Activation Benchmarks
 *
 * Forward and backward cost of each activation lifted to a 64-lane module.
 * Backward compares the automatic (Dual-evaluated) rules with Sigmoid's
 * explicit one.
 */

#include <array>
#include <cstddef>
#include <cstdint>

#include "difflane/autograd/differentiation.h"
#include "difflane/nn/activation.h"
#include "difflane/nn/activations.h"
#include <benchmark/benchmark.h>

using namespace difflane;

namespace {

constexpr std::size_t kLanes = 64;

std::array<float, kLanes> makeInput() {
    std::array<float, kLanes> input{};
    for (std::size_t i = 0; i < kLanes; ++i) {
        input[i] = -4.0f + 8.0f * static_cast<float>(i) / static_cast<float>(kLanes - 1);
    }
    return input;
}

template <typename A>
void BM_Forward(benchmark::State& state) {
    const nn::Elementwise<A, kLanes> module;
    auto input = makeInput();

    for (auto _ : state) {
        benchmark::DoNotOptimize(input);
        auto output = module.forward(input);
        benchmark::DoNotOptimize(output);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kLanes));
}

template <typename A>
void BM_Backward(benchmark::State& state) {
    const nn::Elementwise<A, kLanes> module;
    const auto input = makeInput();
    std::array<float, kLanes> grad{};
    grad.fill(1.0f);

    std::array<autograd::DifferentialPair<float>, kLanes> pairs{};
    for (auto _ : state) {
        for (std::size_t i = 0; i < kLanes; ++i) {
            pairs[i] = autograd::DifferentialPair<float>(input[i]);
        }
        autograd::backward(module, pairs, grad);
        benchmark::DoNotOptimize(pairs);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kLanes));
}

}  // namespace

//! Forward

BENCHMARK_TEMPLATE(BM_Forward, nn::None<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::ReLU<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::LeakyReLU<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::ELU<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::Swish<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::Tanh<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::Sigmoid<float>);
BENCHMARK_TEMPLATE(BM_Forward, nn::Exp<float>);

//! Backward

BENCHMARK_TEMPLATE(BM_Backward, nn::ReLU<float>);
BENCHMARK_TEMPLATE(BM_Backward, nn::ELU<float>);
BENCHMARK_TEMPLATE(BM_Backward, nn::Swish<float>);
BENCHMARK_TEMPLATE(BM_Backward, nn::Tanh<float>);
BENCHMARK_TEMPLATE(BM_Backward, nn::Sigmoid<float>);
