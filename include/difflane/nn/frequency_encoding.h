#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "difflane/scalar.h"

namespace difflane {
namespace nn {

// Largest scale count the angle-doubling recurrence is used for, per scalar
// precision. Each doubling roughly doubles the absolute error of the previous
// pair; the cap keeps the last scale within 1e-5 of direct evaluation in
// float and within 1e-6 in double.
template <Real T>
inline constexpr std::size_t kMaxFrequencyScales = 16;

template <>
inline constexpr std::size_t kMaxFrequencyScales<float> = 4;

/**
 * @brief Multi-scale sine/cosine (positional) encoding.
 *
 * Maps NumInputs lanes to 2 * NumScales * NumInputs lanes. For input lane i
 * and scale j in [0, NumScales):
 *   out[i * NumScales * 2 + j * 2]     = sin(2^j * pi * x[i])
 *   out[i * NumScales * 2 + j * 2 + 1] = cos(2^j * pi * x[i])
 *
 * Only the base pair (sin(pi x), cos(pi x)) is evaluated directly; every higher
 * scale comes from the double-angle identities
 *   sin(2t) = 2 sin(t) cos(t)
 *   cos(2t) = 2 cos(t)^2 - 1
 * applied to the previous pair. Error accumulates across scales; NumScales is
 * capped at kMaxFrequencyScales<T>.
 *
 * There is no explicit backward rule; autograd::backward() derives it by
 * evaluating forward() over Dual<T>.
 */
template <Real T, std::size_t NumInputs, std::size_t NumScales>
class FrequencyEncoding {
    static_assert(NumInputs > 0, "FrequencyEncoding needs at least one input lane");
    static_assert(NumScales > 0, "FrequencyEncoding needs at least one scale");
    static_assert(NumScales <= kMaxFrequencyScales<T>,
                  "Angle-doubling drift exceeds the precision bound past kMaxFrequencyScales<T>");

  public:
    using scalar_type = T;

    static constexpr std::size_t kNumScales = NumScales;
    static constexpr std::size_t kInputWidth = NumInputs;
    static constexpr std::size_t kOutputWidth = 2 * NumScales * NumInputs;
    static constexpr std::string_view kName = "FrequencyEncoding";

    template <Real S>
    std::array<S, kOutputWidth> forward(const std::array<S, kInputWidth>& input) const {
        std::array<S, kOutputWidth> output{};
        const S pi = math::pi<S>();

        for (std::size_t i = 0; i < NumInputs; ++i) {
            auto [s, c] = math::sincos(pi * input[i]);

            const std::size_t base = i * NumScales * 2;
            output[base] = s;
            output[base + 1] = c;

            for (std::size_t j = 1; j < NumScales; ++j) {
                const S sn = S(2) * s * c;
                const S cn = S(2) * c * c - S(1);
                s = sn;
                c = cn;
                output[base + j * 2] = s;
                output[base + j * 2 + 1] = c;
            }
        }
        return output;
    }
};

}  // namespace nn
}  // namespace difflane
