#pragma once

#include <type_traits>
#include <utility>

#include "difflane/scalar.h"

namespace difflane {
namespace autograd {

/**
 * @brief Forward-mode tangent scalar.
 *
 * Carries a primal value together with its directional derivative. Any
 * transform written against the Real concept can be evaluated over Dual<T>,
 * which is how backward rules are derived for the automatic policy: seed the
 * input tangent with 1 and read d(output)/d(input) off the result.
 *
 * Example:
 * @code
 *   Dual<float> x(2.0f, 1.0f);
 *   Dual<float> y = x * x;  // y.value() == 4, y.tangent() == 4
 * @endcode
 */
template <Real T>
class Dual {
  public:
    constexpr Dual() = default;

    // Constants lift with a zero tangent
    template <typename U>
        requires std::is_arithmetic_v<U>
    constexpr Dual(U value) : mValue(static_cast<T>(value)), mTangent(0) {}

    constexpr Dual(const T& value, const T& tangent) : mValue(value), mTangent(tangent) {}

    constexpr const T& value() const { return mValue; }
    constexpr const T& tangent() const { return mTangent; }

    friend constexpr Dual operator+(const Dual& a, const Dual& b) {
        return {a.mValue + b.mValue, a.mTangent + b.mTangent};
    }

    friend constexpr Dual operator-(const Dual& a, const Dual& b) {
        return {a.mValue - b.mValue, a.mTangent - b.mTangent};
    }

    friend constexpr Dual operator-(const Dual& a) { return {-a.mValue, -a.mTangent}; }

    // (ab)' = a'b + ab'
    friend constexpr Dual operator*(const Dual& a, const Dual& b) {
        return {a.mValue * b.mValue, a.mTangent * b.mValue + a.mValue * b.mTangent};
    }

    // (a/b)' = (a'b - ab') / b^2
    friend constexpr Dual operator/(const Dual& a, const Dual& b) {
        return {a.mValue / b.mValue,
                (a.mTangent * b.mValue - a.mValue * b.mTangent) / (b.mValue * b.mValue)};
    }

    // Ordering only looks at the primal
    friend constexpr bool operator<(const Dual& a, const Dual& b) { return a.mValue < b.mValue; }
    friend constexpr bool operator==(const Dual& a, const Dual& b) { return a.mValue == b.mValue; }

  private:
    T mValue{};
    T mTangent{};
};

}  // namespace autograd

// ============================================================================
// Scalar Traits for Dual
// ============================================================================

template <Real T>
struct scalar_traits<autograd::Dual<T>> {
    using D = autograd::Dual<T>;
    using differential_type = T;

    static constexpr D pi() { return D(scalar_traits<T>::pi(), T(0)); }

    // Ties return the mean of both tangents (the symmetric subgradient), so the
    // derivative at a kink agrees with a central difference.
    static D min(const D& a, const D& b) {
        if (b.value() < a.value()) {
            return b;
        }
        if (a.value() == b.value()) {
            return D(a.value(), (a.tangent() + b.tangent()) * T(0.5));
        }
        return a;
    }

    static D max(const D& a, const D& b) {
        if (a.value() < b.value()) {
            return b;
        }
        if (a.value() == b.value()) {
            return D(a.value(), (a.tangent() + b.tangent()) * T(0.5));
        }
        return a;
    }

    static D exp(const D& x) {
        const T e = scalar_traits<T>::exp(x.value());
        return D(e, e * x.tangent());
    }

    static D tanh(const D& x) {
        const T t = scalar_traits<T>::tanh(x.value());
        return D(t, (T(1) - t * t) * x.tangent());
    }

    static std::pair<D, D> sincos(const D& x) {
        const auto [s, c] = scalar_traits<T>::sincos(x.value());
        return {D(s, c * x.tangent()), D(c, -s * x.tangent())};
    }
};

}  // namespace difflane
