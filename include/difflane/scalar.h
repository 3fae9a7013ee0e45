#pragma once

#include <cmath>
#include <concepts>
#include <numbers>
#include <type_traits>
#include <utility>

namespace difflane {

// ============================================================================
// Scalar Traits
// ============================================================================
// Maps a scalar type to the numeric primitives the transforms are written
// against. Example: scalar_traits<float>::exp(x) == std::exp(x)

template <typename T>
struct scalar_traits;  // Forward declaration - no definition means unsupported types fail

// Shared implementation for the built-in IEEE types
template <std::floating_point F>
struct floating_scalar_traits {
    // Gradients of a plain float live in the same type
    using differential_type = F;

    static constexpr F pi() { return std::numbers::pi_v<F>; }

    // A NaN in the first argument propagates instead of being replaced by the second
    static F min(F a, F b) { return b < a ? b : a; }
    static F max(F a, F b) { return a < b ? b : a; }

    static F exp(F x) { return std::exp(x); }
    static F tanh(F x) { return std::tanh(x); }

    // Returns (sin x, cos x)
    static std::pair<F, F> sincos(F x) { return {std::sin(x), std::cos(x)}; }
};

template <>
struct scalar_traits<float> : floating_scalar_traits<float> {};

template <>
struct scalar_traits<double> : floating_scalar_traits<double> {};

// ============================================================================
// Concepts - Compile-Time Type Constraints
// ============================================================================

// Concept: T behaves like a real number the transforms can be evaluated over.
// Requirements:
// 1. Field arithmetic and ordering
// 2. Construction from a floating-point literal (for constants like 0, 1, 2)
// 3. A scalar_traits specialization providing min/max/exp/tanh/sincos/pi
// 4. An associated differential type for the backward pass
template <typename T>
concept Real = std::copyable<T> && std::constructible_from<T, double> &&
    requires(const T& a, const T& b) {
        { a + b } -> std::convertible_to<T>;
        { a - b } -> std::convertible_to<T>;
        { a * b } -> std::convertible_to<T>;
        { a / b } -> std::convertible_to<T>;
        { -a } -> std::convertible_to<T>;
        { a < b } -> std::convertible_to<bool>;
        typename scalar_traits<T>::differential_type;
        { scalar_traits<T>::pi() } -> std::convertible_to<T>;
        { scalar_traits<T>::min(a, b) } -> std::convertible_to<T>;
        { scalar_traits<T>::max(a, b) } -> std::convertible_to<T>;
        { scalar_traits<T>::exp(a) } -> std::convertible_to<T>;
        { scalar_traits<T>::tanh(a) } -> std::convertible_to<T>;
        { scalar_traits<T>::sincos(a) } -> std::convertible_to<std::pair<T, T>>;
    };

template <Real T>
using differential_t = typename scalar_traits<T>::differential_type;

// ============================================================================
// Math Helpers
// ============================================================================
// Qualified entry points so templates never pick up std:: overloads by accident

namespace math {

template <Real T>
inline T pi() {
    return scalar_traits<T>::pi();
}

template <Real T>
inline T min(const T& a, const T& b) {
    return scalar_traits<T>::min(a, b);
}

template <Real T>
inline T max(const T& a, const T& b) {
    return scalar_traits<T>::max(a, b);
}

template <Real T>
inline T exp(const T& x) {
    return scalar_traits<T>::exp(x);
}

template <Real T>
inline T tanh(const T& x) {
    return scalar_traits<T>::tanh(x);
}

template <Real T>
inline std::pair<T, T> sincos(const T& x) {
    return scalar_traits<T>::sincos(x);
}

}  // namespace math

}  // namespace difflane
