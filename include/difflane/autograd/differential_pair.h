#pragma once

#include "difflane/scalar.h"

namespace difflane {
namespace autograd {

// DifferentialPair: a primal value and the gradient flowing through it.
// Only lives for the duration of one backward call. On entry to a backward
// rule grad() is unspecified; on exit it holds dL/d(primal).
template <Real T>
class DifferentialPair {
  public:
    using differential_type = differential_t<T>;

    DifferentialPair() = default;
    explicit DifferentialPair(const T& primal) : mPrimal(primal), mGrad(0) {}
    DifferentialPair(const T& primal, const differential_type& grad)
        : mPrimal(primal), mGrad(grad) {}

    const T& primal() const { return mPrimal; }
    const differential_type& grad() const { return mGrad; }

  private:
    T mPrimal{};
    differential_type mGrad{};
};

}  // namespace autograd
}  // namespace difflane
