#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "difflane/scalar.h"

namespace difflane {

/**
 * @brief Flat primal buffer paired with an equally sized gradient buffer.
 *
 * Holds lane groups back to back: element [g * width + lane] belongs to lane
 * group g. The buffer does not know the module width; dispatch() checks that
 * the size divides evenly.
 *
 * primal() and grad() always have size() elements. Element access goes through
 * fixed-size spans; only resize() changes the length, and it changes both.
 */
template <Real T>
class DifferentiableBuffer {
  public:
    using differential_type = differential_t<T>;

    DifferentiableBuffer() = default;

    explicit DifferentiableBuffer(std::size_t size) : mPrimal(size, T(0)), mGrad(size, T(0)) {}

    // Gradients start at zero
    explicit DifferentiableBuffer(std::vector<T> primal)
        : mPrimal(std::move(primal)), mGrad(mPrimal.size(), differential_type(0)) {}

    /**
     * @throws std::runtime_error if primal and grad sizes differ
     */
    DifferentiableBuffer(std::vector<T> primal, std::vector<differential_type> grad)
        : mPrimal(std::move(primal)), mGrad(std::move(grad)) {
        if (mPrimal.size() != mGrad.size()) {
            throw std::runtime_error("DifferentiableBuffer: primal has " +
                                     std::to_string(mPrimal.size()) + " elements but grad has " +
                                     std::to_string(mGrad.size()));
        }
    }

    std::size_t size() const { return mPrimal.size(); }
    bool empty() const { return mPrimal.empty(); }

    std::span<T> primal() { return mPrimal; }
    std::span<const T> primal() const { return mPrimal; }

    std::span<differential_type> grad() { return mGrad; }
    std::span<const differential_type> grad() const { return mGrad; }

    void resize(std::size_t size) {
        mPrimal.resize(size, T(0));
        mGrad.resize(size, differential_type(0));
    }

    void zeroGrad() {
        for (auto& g : mGrad) {
            g = differential_type(0);
        }
    }

  private:
    std::vector<T> mPrimal;
    std::vector<differential_type> mGrad;
};

}  // namespace difflane
