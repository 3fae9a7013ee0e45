#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "difflane/autograd/differential_pair.h"
#include "difflane/autograd/differentiation.h"
#include "difflane/nn/module.h"
#include "difflane/scalar.h"

namespace difflane {
namespace autograd {

// Node: backward function for one recorded forward call.
// An external engine holds these in its graph and calls backward() in reverse
// topological order. N is the width of the recorded input, M of its output.
template <Real T, std::size_t N, std::size_t M>
class Node {
  public:
    virtual ~Node() = default;

    // Given dL/d(output), return dL/d(input)
    virtual std::array<differential_t<T>, N> backward(
        const std::array<differential_t<T>, M>& gradOutput) = 0;

    // Name for debugging (e.g. "SigmoidBackward")
    virtual std::string name() const = 0;

    static constexpr std::size_t numInputs() { return N; }
    static constexpr std::size_t numOutputs() { return M; }
};

/**
 * @brief Backward node for any fixed-width module.
 *
 * Always saves the input, since both backward policies need the primal.
 * The output is only saved when the module does not declare
 * kPreferRecompute; a recompute-preferring module (Sigmoid) rebuilds whatever
 * it needs from the input, so the scheduler can drop the forward result.
 */
template <nn::FixedWidthModule Module>
class ModuleBackward
    : public Node<typename Module::scalar_type, Module::kInputWidth, Module::kOutputWidth> {
  public:
    using T = typename Module::scalar_type;
    static constexpr std::size_t N = Module::kInputWidth;
    static constexpr std::size_t M = Module::kOutputWidth;

    ModuleBackward(const Module& module, const std::array<T, N>& input,
                   const std::array<T, M>& output)
        : mModule(module), mSavedInput(input) {
        if constexpr (!prefersRecompute<Module>) {
            mSavedOutput = output;
        }
    }

    std::array<differential_t<T>, N> backward(
        const std::array<differential_t<T>, M>& gradOutput) override {
        std::array<DifferentialPair<T>, N> pairs{};
        for (std::size_t i = 0; i < N; ++i) {
            pairs[i] = DifferentialPair<T>(mSavedInput[i]);
        }

        autograd::backward(mModule, pairs, gradOutput);

        std::array<differential_t<T>, N> gradInput{};
        for (std::size_t i = 0; i < N; ++i) {
            gradInput[i] = pairs[i].grad();
        }
        return gradInput;
    }

    std::string name() const override { return std::string(nn::moduleName<Module>()) + "Backward"; }

    bool savesOutput() const { return mSavedOutput.has_value(); }
    const std::array<T, N>& savedInput() const { return mSavedInput; }
    const std::optional<std::array<T, M>>& savedOutput() const { return mSavedOutput; }

  private:
    Module mModule;
    std::array<T, N> mSavedInput;
    std::optional<std::array<T, M>> mSavedOutput;
};

// Result of a recorded forward call: the output and the node that undoes it
template <nn::FixedWidthModule Module>
struct Recorded {
    nn::output_t<Module> output;
    std::shared_ptr<ModuleBackward<Module>> gradFn;
};

// Run forward and attach a backward node, the way an engine records a graph edge
template <nn::FixedWidthModule Module>
Recorded<Module> record(const Module& module, const nn::input_t<Module>& input) {
    auto output = module.forward(input);
    auto node = std::make_shared<ModuleBackward<Module>>(module, input, output);
    return {std::move(output), std::move(node)};
}

}  // namespace autograd
}  // namespace difflane
