#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <string_view>

#include "difflane/scalar.h"

namespace difflane {
namespace nn {

/**
 * @brief Compile-time contract shared by every fixed-width module.
 *
 * A module maps std::array<T, N> to std::array<T, M> where N and M are known
 * at build time. There is no base class: any type exposing
 *   - scalar_type            the Real scalar it is evaluated over
 *   - kInputWidth (N > 0)    lanes consumed
 *   - kOutputWidth (M > 0)   lanes produced
 *   - forward(const std::array<T, N>&) const -> std::array<T, M>
 * is a module. Passing a vector of the wrong width is a compile error.
 *
 * Modules may optionally declare
 *   - kName                  used by logging and backward nodes
 *   - kDiffPolicy            see autograd/differentiation.h
 *   - kPreferRecompute       recompute-over-store hint for the scheduler
 *   - backward(...)          an explicit reverse-mode rule
 */
template <typename M>
concept FixedWidthModule = requires {
    typename M::scalar_type;
    { M::kInputWidth } -> std::convertible_to<std::size_t>;
    { M::kOutputWidth } -> std::convertible_to<std::size_t>;
} && Real<typename M::scalar_type> && (M::kInputWidth > 0) && (M::kOutputWidth > 0) &&
    requires(const M& module,
             const std::array<typename M::scalar_type, M::kInputWidth>& input) {
        {
            module.forward(input)
            } -> std::same_as<std::array<typename M::scalar_type, M::kOutputWidth>>;
    };

template <FixedWidthModule M>
using input_t = std::array<typename M::scalar_type, M::kInputWidth>;

template <FixedWidthModule M>
using output_t = std::array<typename M::scalar_type, M::kOutputWidth>;

// Name reported in logs and by backward nodes
template <typename M>
constexpr std::string_view moduleName() {
    if constexpr (requires { M::kName; }) {
        return M::kName;
    } else {
        return "Module";
    }
}

}  // namespace nn
}  // namespace difflane
