#pragma once

#include <string_view>

#include "difflane/autograd/differentiation.h"
#include "difflane/nn/activation.h"
#include "difflane/scalar.h"

namespace difflane {
namespace nn {

// Activation variants. Each is a value type configured for scalar T; activate()
// is a member template so the automatic policy can evaluate it over Dual<T>.
// Instances are immutable once built: parameters are only read by activate().

// ============================================================================
// None
// ============================================================================

// None(x) = x
template <Real T>
struct None {
    using scalar_type = T;
    static constexpr std::string_view kName = "None";

    template <Real S>
    S activate(const S& x) const {
        return x;
    }
};

// ============================================================================
// ReLU
// ============================================================================

// ReLU(x) = max(x, 0)
template <Real T>
struct ReLU {
    using scalar_type = T;
    static constexpr std::string_view kName = "ReLU";

    template <Real S>
    S activate(const S& x) const {
        return math::max(x, S(0));
    }
};

// ============================================================================
// LeakyReLU
// ============================================================================

// LeakyReLU(x) = max(x, 0) + slope * min(x, 0)
template <Real T>
struct LeakyReLU {
    using scalar_type = T;
    static constexpr std::string_view kName = "LeakyReLU";

    T slope = T(0.01);

    template <Real S>
    S activate(const S& x) const {
        return math::max(x, S(0)) + S(slope) * math::min(x, S(0));
    }
};

// ============================================================================
// ELU
// ============================================================================

// ELU(x) = a * (exp(-min(x, 0)) - 1) + max(x, 0)
//
// The exponent is negated: for x < 0 this is a * (exp(-x) - 1), which grows
// with |x|. ELU(-2) with a = 1 is e^2 - 1.
template <Real T>
struct ELU {
    using scalar_type = T;
    static constexpr std::string_view kName = "ELU";

    T a = T(1);

    template <Real S>
    S activate(const S& x) const {
        return S(a) * (math::exp(-math::min(x, S(0))) - S(1)) + math::max(x, S(0));
    }
};

// ============================================================================
// Swish
// ============================================================================

// Swish(x) = x / (1 + exp(-x))
template <Real T>
struct Swish {
    using scalar_type = T;
    static constexpr std::string_view kName = "Swish";

    template <Real S>
    S activate(const S& x) const {
        return x / (S(1) + math::exp(-x));
    }
};

// ============================================================================
// Tanh
// ============================================================================

template <Real T>
struct Tanh {
    using scalar_type = T;
    static constexpr std::string_view kName = "Tanh";

    template <Real S>
    S activate(const S& x) const {
        return math::tanh(x);
    }
};

// ============================================================================
// Sigmoid
// ============================================================================

/**
 * @brief Sigmoid(x) = 1 / (1 + exp(-x)), with a hand-written backward rule.
 *
 * Backward: dL/dx = s * (1 - s) * dL/dy, where s is recomputed from the primal
 * input rather than read from a value retained by the forward pass. The
 * kPreferRecompute hint tells the memory scheduler it need not keep the output.
 */
template <Real T>
struct Sigmoid {
    using scalar_type = T;
    static constexpr std::string_view kName = "Sigmoid";
    static constexpr autograd::DiffPolicy kDiffPolicy = autograd::DiffPolicy::Explicit;
    static constexpr bool kPreferRecompute = true;

    template <Real S>
    S activate(const S& x) const {
        return S(1) / (S(1) + math::exp(-x));
    }

    void activateBwd(autograd::DifferentialPair<T>& x, const differential_t<T>& grad) const {
        const T s = activate(x.primal());
        x = autograd::DifferentialPair<T>(x.primal(), s * (T(1) - s) * grad);
    }
};

// ============================================================================
// Exp
// ============================================================================

// Exp(x) = exp(x). Overflows to +inf for large x; no clamping is applied.
template <Real T>
struct Exp {
    using scalar_type = T;
    static constexpr std::string_view kName = "Exp";

    template <Real S>
    S activate(const S& x) const {
        return math::exp(x);
    }
};

}  // namespace nn
}  // namespace difflane
