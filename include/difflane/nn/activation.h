#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <string_view>

#include "difflane/autograd/differentiation.h"
#include "difflane/nn/module.h"
#include "difflane/scalar.h"

namespace difflane {
namespace nn {

/**
 * @brief Contract for a scalar activation function.
 *
 * An activation is a small value type exposing
 *   - scalar_type                 the Real type it is configured for
 *   - activate(T) const -> T      the forward formula
 * and optionally the differentiation metadata described in
 * autograd/differentiation.h (kDiffPolicy, kPreferRecompute, activateBwd).
 */
template <typename A, typename T>
concept ScalarActivation = Real<T> && std::copyable<A> && requires(const A& activation, const T& x) {
    { activation.activate(x) } -> std::same_as<T>;
};

template <typename A>
concept Activation = requires { typename A::scalar_type; } &&
    ScalarActivation<A, typename A::scalar_type>;

/**
 * @brief Lifts a scalar activation to a K-lane module.
 *
 * Forward applies the activation to every lane independently, in lane order.
 * Backward applies the activation's scalar rule (automatic or explicit) to
 * every lane independently. No lane ever reads another lane.
 *
 * Usage:
 * @code
 *   Elementwise<ReLU<float>, 4> relu;
 *   auto y = relu.forward(std::array<float, 4>{-1, 0, 1, 2});  // {0, 0, 1, 2}
 * @endcode
 */
template <Activation A, std::size_t K>
class Elementwise {
    static_assert(K > 0, "Elementwise width must be positive");

  public:
    using activation_type = A;
    using scalar_type = typename A::scalar_type;

    static constexpr std::size_t kInputWidth = K;
    static constexpr std::size_t kOutputWidth = K;
    static constexpr std::string_view kName = moduleName<A>();

    // Per-lane hints are the activation's own
    static constexpr autograd::DiffPolicy kDiffPolicy = autograd::diff_traits<A>::kDiffPolicy;
    static constexpr bool kPreferRecompute = autograd::diff_traits<A>::kPreferRecompute;

    Elementwise() = default;
    explicit Elementwise(const A& activation) : mActivation(activation) {}

    template <Real S>
    std::array<S, K> forward(const std::array<S, K>& input) const {
        std::array<S, K> output{};
        for (std::size_t i = 0; i < K; ++i) {
            output[i] = mActivation.activate(input[i]);
        }
        return output;
    }

    void backward(std::array<autograd::DifferentialPair<scalar_type>, K>& input,
                  const std::array<differential_t<scalar_type>, K>& gradOutput) const {
        for (std::size_t i = 0; i < K; ++i) {
            autograd::backward(mActivation, input[i], gradOutput[i]);
        }
    }

    const A& activation() const { return mActivation; }

  private:
    A mActivation{};
};

// Wrap an activation instance as a K-lane module
template <std::size_t K, Activation A>
Elementwise<A, K> lift(const A& activation) {
    return Elementwise<A, K>(activation);
}

// Apply an activation to a fixed-width vector without naming the adapter
template <Activation A, std::size_t K>
std::array<typename A::scalar_type, K> forward(const A& activation,
                                               const std::array<typename A::scalar_type, K>& input) {
    return Elementwise<A, K>(activation).forward(input);
}

}  // namespace nn
}  // namespace difflane
