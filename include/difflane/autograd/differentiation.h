#pragma once

#include <array>
#include <concepts>
#include <cstddef>

#include "difflane/autograd/differential_pair.h"
#include "difflane/autograd/dual.h"
#include "difflane/nn/module.h"
#include "difflane/scalar.h"

namespace difflane {
namespace autograd {

// ============================================================================
// Differentiation Policy
// ============================================================================

// How the backward rule of a transform is obtained
enum class DiffPolicy {
    Automatic,  // derived mechanically from the forward formula
    Explicit,   // hand-written rule that replaces the derived one
};

/**
 * @brief Differentiation metadata read by the engine and memory scheduler.
 *
 * Types opt in by declaring static members:
 * @code
 *   static constexpr DiffPolicy kDiffPolicy = DiffPolicy::Explicit;
 *   static constexpr bool kPreferRecompute = true;
 * @endcode
 * Undeclared members default to Automatic / store.
 */
template <typename X>
struct diff_traits {
    static constexpr DiffPolicy kDiffPolicy = [] {
        if constexpr (requires { X::kDiffPolicy; }) {
            return X::kDiffPolicy;
        } else {
            return DiffPolicy::Automatic;
        }
    }();

    static constexpr bool kPreferRecompute = [] {
        if constexpr (requires { X::kPreferRecompute; }) {
            return static_cast<bool>(X::kPreferRecompute);
        } else {
            return false;
        }
    }();
};

template <typename X>
inline constexpr bool hasExplicitBackward = diff_traits<X>::kDiffPolicy == DiffPolicy::Explicit;

template <typename X>
inline constexpr bool prefersRecompute = diff_traits<X>::kPreferRecompute;

// ============================================================================
// Backward Rule Concepts
// ============================================================================

// Scalar rule: replaces x with (x.primal, dL/dx) given dL/dy
template <typename A, typename T>
concept ExplicitScalarBackward = requires(const A& activation, DifferentialPair<T>& x,
                                          const differential_t<T>& grad) {
    activation.activateBwd(x, grad);
};

// activate() can be evaluated over tangent scalars
template <typename A, typename T>
concept DualActivation = requires(const A& activation, const Dual<T>& x) {
    { activation.activate(x) } -> std::same_as<Dual<T>>;
};

template <typename M>
concept ExplicitModuleBackward =
    nn::FixedWidthModule<M> &&
    requires(const M& module,
             std::array<DifferentialPair<typename M::scalar_type>, M::kInputWidth>& input,
             const std::array<differential_t<typename M::scalar_type>, M::kOutputWidth>& grad) {
        module.backward(input, grad);
    };

template <typename M>
concept DualModule =
    nn::FixedWidthModule<M> &&
    requires(const M& module, const std::array<Dual<typename M::scalar_type>, M::kInputWidth>& in) {
        {
            module.forward(in)
            } -> std::same_as<std::array<Dual<typename M::scalar_type>, M::kOutputWidth>>;
    };

// ============================================================================
// Backward Dispatch
// ============================================================================

// Scalar backward: given dL/dy for y = activation.activate(x.primal()), write
// dL/dx into x. Explicit rules are called as-is; automatic ones evaluate the
// forward formula over Dual<T> with a unit tangent.
template <typename A, Real T>
    requires requires(const A& activation, const T& x) {
        { activation.activate(x) } -> std::same_as<T>;
    }
void backward(const A& activation, DifferentialPair<T>& x, const differential_t<T>& grad) {
    if constexpr (hasExplicitBackward<A>) {
        static_assert(ExplicitScalarBackward<A, T>,
                      "DiffPolicy::Explicit requires activateBwd(DifferentialPair<T>&, grad)");
        activation.activateBwd(x, grad);
    } else {
        static_assert(DualActivation<A, T>,
                      "Automatic differentiation requires activate() to accept Dual<T>");
        const Dual<T> y = activation.activate(Dual<T>(x.primal(), T(1)));
        x = DifferentialPair<T>(x.primal(), y.tangent() * grad);
    }
}

// Module backward: given dL/d(output), write dL/d(input) into every input pair.
// Modules with an explicit backward() are delegated to. Otherwise the
// vector-Jacobian product is assembled from one forward-mode pass per input lane.
template <nn::FixedWidthModule M>
void backward(const M& module,
              std::array<DifferentialPair<typename M::scalar_type>, M::kInputWidth>& input,
              const std::array<differential_t<typename M::scalar_type>, M::kOutputWidth>& grad) {
    using T = typename M::scalar_type;
    constexpr std::size_t N = M::kInputWidth;

    if constexpr (ExplicitModuleBackward<M>) {
        module.backward(input, grad);
    } else {
        static_assert(DualModule<M>,
                      "Module has no explicit backward() and forward() cannot be "
                      "evaluated over Dual<T>");

        std::array<Dual<T>, N> seeded{};
        for (std::size_t j = 0; j < N; ++j) {
            seeded[j] = Dual<T>(input[j].primal(), T(0));
        }

        std::array<T, N> result{};
        for (std::size_t i = 0; i < N; ++i) {
            seeded[i] = Dual<T>(input[i].primal(), T(1));
            const auto out = module.forward(seeded);
            seeded[i] = Dual<T>(input[i].primal(), T(0));

            T sum(0);
            for (std::size_t k = 0; k < M::kOutputWidth; ++k) {
                sum = sum + out[k].tangent() * grad[k];
            }
            result[i] = sum;
        }

        for (std::size_t i = 0; i < N; ++i) {
            input[i] = DifferentialPair<T>(input[i].primal(), result[i]);
        }
    }
}

}  // namespace autograd
}  // namespace difflane
