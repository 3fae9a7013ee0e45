#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <type_traits>

#include "difflane/autograd/dual.h"
#include "difflane/scalar.h"
#include <gtest/gtest.h>

using namespace difflane;

// ============================================================================
// Real Concept Tests (Compile-time)
// ============================================================================

TEST(ScalarTest, BuiltinFloatingTypesAreReal) {
    static_assert(Real<float>, "float should satisfy Real");
    static_assert(Real<double>, "double should satisfy Real");
    SUCCEED();
}

TEST(ScalarTest, DualIsReal) {
    static_assert(Real<autograd::Dual<float>>, "Dual<float> should satisfy Real");
    static_assert(Real<autograd::Dual<double>>, "Dual<double> should satisfy Real");
    SUCCEED();
}

TEST(ScalarTest, UnsupportedTypesAreRejected) {
    static_assert(!Real<int>, "int has no scalar_traits");
    static_assert(!Real<std::string>, "std::string is not a number");
    static_assert(!Real<float*>, "pointers are not numbers");
    SUCCEED();
}

TEST(ScalarTest, DifferentialTypes) {
    static_assert(std::is_same_v<differential_t<float>, float>);
    static_assert(std::is_same_v<differential_t<double>, double>);
    static_assert(std::is_same_v<differential_t<autograd::Dual<float>>, float>);
    SUCCEED();
}

// ============================================================================
// Math Helper Tests
// ============================================================================

TEST(ScalarTest, PiMatchesStandardConstant) {
    EXPECT_FLOAT_EQ(math::pi<float>(), std::numbers::pi_v<float>);
    EXPECT_DOUBLE_EQ(math::pi<double>(), std::numbers::pi);
}

TEST(ScalarTest, MinMaxSelectCorrectly) {
    EXPECT_FLOAT_EQ(math::max(-2.0f, 0.0f), 0.0f);
    EXPECT_FLOAT_EQ(math::max(3.0f, 0.0f), 3.0f);
    EXPECT_FLOAT_EQ(math::min(-2.0f, 0.0f), -2.0f);
    EXPECT_FLOAT_EQ(math::min(3.0f, 0.0f), 0.0f);
}

TEST(ScalarTest, MinMaxPropagateNaNFromFirstArgument) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE(std::isnan(math::max(nan, 0.0f)));
    EXPECT_TRUE(std::isnan(math::min(nan, 0.0f)));
}

TEST(ScalarTest, SincosMatchesSeparateCalls) {
    for (double x : {-3.0, -0.5, 0.0, 0.25, 1.0, 7.5}) {
        const auto [s, c] = math::sincos(x);
        EXPECT_DOUBLE_EQ(s, std::sin(x));
        EXPECT_DOUBLE_EQ(c, std::cos(x));
    }
}

TEST(ScalarTest, ExpAndTanh) {
    EXPECT_DOUBLE_EQ(math::exp(1.0), std::numbers::e);
    EXPECT_DOUBLE_EQ(math::tanh(0.0), 0.0);
    EXPECT_NEAR(math::tanh(0.5), 0.46211715726000974, 1e-15);
}

TEST(ScalarTest, ExpOverflowsToInfinity) {
    EXPECT_TRUE(std::isinf(math::exp(1000.0f)));
}
