#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "difflane/autograd/differential_pair.h"
#include "difflane/autograd/differentiation.h"
#include "difflane/dispatch/call_mode.h"
#include "difflane/dispatch/differentiable_buffer.h"
#include "difflane/nn/module.h"

namespace difflane {

namespace detail {

// Number of lane groups in a buffer of `length` elements.
// Throws std::runtime_error (and logs it) if length is not a multiple of width.
std::size_t laneGroups(std::size_t length, std::size_t width, std::string_view moduleName,
                       std::string_view bufferName);

// Log on the "Dispatch" scope, then throw std::runtime_error
[[noreturn]] void dispatchError(const std::string& message);

void logDispatch(CallMode mode, std::string_view moduleName, std::size_t groups);

}  // namespace detail

/**
 * @brief Run a module over every lane group of a flat buffer (primal mode only).
 *
 * input holds G groups of kInputWidth values; output is resized to G groups of
 * kOutputWidth values. Groups are independent and processed in order.
 *
 * @throws std::runtime_error if mode is not CallMode::Primal, or if the input
 *         size is not a multiple of kInputWidth
 */
template <nn::FixedWidthModule M>
void dispatch(const M& module, CallMode mode, const std::vector<typename M::scalar_type>& input,
              std::vector<typename M::scalar_type>& output) {
    using T = typename M::scalar_type;
    constexpr std::size_t N = M::kInputWidth;
    constexpr std::size_t K = M::kOutputWidth;
    constexpr std::string_view name = nn::moduleName<M>();

    if (mode != CallMode::Primal) {
        detail::dispatchError(std::string(name) +
                              ": backward dispatch needs DifferentiableBuffer arguments");
    }

    const std::size_t groups = detail::laneGroups(input.size(), N, name, "input");
    detail::logDispatch(mode, name, groups);

    output.resize(groups * K);
    std::array<T, N> lanes{};
    for (std::size_t g = 0; g < groups; ++g) {
        for (std::size_t i = 0; i < N; ++i) {
            lanes[i] = input[g * N + i];
        }
        const auto result = module.forward(lanes);
        for (std::size_t k = 0; k < K; ++k) {
            output[g * K + k] = result[k];
        }
    }
}

/**
 * @brief Run a module over every lane group of differentiable buffers.
 *
 * Primal:   output.primal() <- forward(input.primal()); output is resized and
 *           its gradients zeroed.
 * Backward: input.grad() <- dL/d(input) given output.grad() = dL/d(output).
 *           output must already hold one group per input group.
 *
 * @throws std::runtime_error on sizes that do not match the module widths
 */
template <nn::FixedWidthModule M>
void dispatch(const M& module, CallMode mode, DifferentiableBuffer<typename M::scalar_type>& input,
              DifferentiableBuffer<typename M::scalar_type>& output) {
    using T = typename M::scalar_type;
    constexpr std::size_t N = M::kInputWidth;
    constexpr std::size_t K = M::kOutputWidth;
    constexpr std::string_view name = nn::moduleName<M>();

    const std::size_t groups = detail::laneGroups(input.size(), N, name, "input");

    if (mode == CallMode::Primal) {
        detail::logDispatch(mode, name, groups);
        output.resize(groups * K);
        output.zeroGrad();

        std::array<T, N> lanes{};
        for (std::size_t g = 0; g < groups; ++g) {
            for (std::size_t i = 0; i < N; ++i) {
                lanes[i] = input.primal()[g * N + i];
            }
            const auto result = module.forward(lanes);
            for (std::size_t k = 0; k < K; ++k) {
                output.primal()[g * K + k] = result[k];
            }
        }
        return;
    }

    const std::size_t outputGroups = detail::laneGroups(output.size(), K, name, "output");
    if (outputGroups != groups) {
        detail::dispatchError(std::string(name) + ": input has " + std::to_string(groups) +
                              " lane groups but output has " + std::to_string(outputGroups));
    }
    detail::logDispatch(mode, name, groups);

    std::array<autograd::DifferentialPair<T>, N> pairs{};
    std::array<differential_t<T>, K> gradOutput{};
    for (std::size_t g = 0; g < groups; ++g) {
        for (std::size_t i = 0; i < N; ++i) {
            pairs[i] = autograd::DifferentialPair<T>(input.primal()[g * N + i]);
        }
        for (std::size_t k = 0; k < K; ++k) {
            gradOutput[k] = output.grad()[g * K + k];
        }

        autograd::backward(module, pairs, gradOutput);

        for (std::size_t i = 0; i < N; ++i) {
            input.grad()[g * N + i] = pairs[i].grad();
        }
    }
}

}  // namespace difflane
