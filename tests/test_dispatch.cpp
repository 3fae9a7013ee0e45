#include <algorithm>
#include <array>
#include <cmath>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "difflane/dispatch/dispatch.h"
#include "difflane/logger.h"
#include "difflane/nn/activation.h"
#include "difflane/nn/activations.h"
#include "difflane/nn/frequency_encoding.h"
#include <gtest/gtest.h>

using namespace difflane;

// ============================================================================
// Dispatch Test Fixture
// ============================================================================

class DispatchTest : public ::testing::Test {
  protected:
    void SetUp() override {
        // Dispatch errors are logged before they are thrown; keep test output quiet
        mPreviousLevel = Logger::minLogLevel();
        Logger::setMinLogLevel(LogLevel::FATAL);
    }

    void TearDown() override {
        Logger::flush();
        Logger::setMinLogLevel(mPreviousLevel);
    }

    using Encoding = nn::FrequencyEncoding<double, 2, 2>;
    using Relu = nn::Elementwise<nn::ReLU<double>, 2>;

  private:
    LogLevel mPreviousLevel = LogLevel::INFO;
};

// ============================================================================
// Call Mode
// ============================================================================

TEST(CallModeTest, ToString) {
    EXPECT_EQ(toString(CallMode::Primal), "primal");
    EXPECT_EQ(toString(CallMode::Backward), "backward");
}

// ============================================================================
// Differentiable Buffer
// ============================================================================

TEST(DifferentiableBufferTest, SizedConstructorZeroesBoth) {
    DifferentiableBuffer<float> buffer(4);
    EXPECT_EQ(buffer.size(), 4u);
    EXPECT_FALSE(buffer.empty());
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(buffer.primal()[i], 0.0f);
        EXPECT_EQ(buffer.grad()[i], 0.0f);
    }
}

TEST(DifferentiableBufferTest, PrimalConstructorZeroesGrad) {
    DifferentiableBuffer<double> buffer(std::vector<double>{1.0, 2.0, 3.0});
    ASSERT_EQ(buffer.grad().size(), 3u);
    EXPECT_EQ(buffer.grad()[2], 0.0);
    EXPECT_EQ(buffer.primal()[1], 2.0);
}

TEST(DifferentiableBufferTest, MismatchedSizesThrow) {
    EXPECT_THROW(DifferentiableBuffer<double>(std::vector<double>{1.0, 2.0},
                                              std::vector<double>{1.0}),
                 std::runtime_error);
}

TEST(DifferentiableBufferTest, ResizeAndZeroGrad) {
    DifferentiableBuffer<double> buffer(std::vector<double>{1.0}, std::vector<double>{5.0});
    buffer.resize(3);
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.grad()[0], 5.0);
    buffer.zeroGrad();
    EXPECT_EQ(buffer.grad()[0], 0.0);
    EXPECT_EQ(buffer.primal()[0], 1.0);
}

TEST(DifferentiableBufferTest, AccessorsCannotChangeLength) {
    using Buffer = DifferentiableBuffer<double>;
    static_assert(std::is_same_v<decltype(std::declval<Buffer&>().primal()), std::span<double>>);
    static_assert(std::is_same_v<decltype(std::declval<Buffer&>().grad()), std::span<double>>);
    static_assert(
        std::is_same_v<decltype(std::declval<const Buffer&>().grad()), std::span<const double>>);

    Buffer buffer(std::vector<double>{1.0, 2.0, 3.0, 4.0});
    buffer.resize(6);
    EXPECT_EQ(buffer.primal().size(), 6u);
    EXPECT_EQ(buffer.grad().size(), 6u);
    buffer.resize(2);
    EXPECT_EQ(buffer.primal().size(), buffer.size());
    EXPECT_EQ(buffer.grad().size(), buffer.size());
}

// ============================================================================
// Primal Dispatch
// ============================================================================

TEST_F(DispatchTest, PrimalOverPlainVectors) {
    const std::vector<double> input{-1.0, 2.0, 0.5, -0.5};
    std::vector<double> output;
    dispatch(Relu{}, CallMode::Primal, input, output);

    ASSERT_EQ(output.size(), 4u);
    EXPECT_EQ(output[0], 0.0);
    EXPECT_EQ(output[1], 2.0);
    EXPECT_EQ(output[2], 0.5);
    EXPECT_EQ(output[3], 0.0);
}

TEST_F(DispatchTest, PrimalMatchesPerGroupForward) {
    const Encoding encoding;
    const std::vector<double> input{0.25, -0.1, 0.7, 0.3, -0.9, 0.0};
    std::vector<double> output;
    dispatch(encoding, CallMode::Primal, input, output);

    ASSERT_EQ(output.size(), 3 * Encoding::kOutputWidth);
    for (std::size_t g = 0; g < 3; ++g) {
        const auto expected = encoding.forward(std::array<double, 2>{input[2 * g], input[2 * g + 1]});
        for (std::size_t k = 0; k < Encoding::kOutputWidth; ++k) {
            EXPECT_DOUBLE_EQ(output[g * Encoding::kOutputWidth + k], expected[k]);
        }
    }
}

TEST_F(DispatchTest, EmptyInputProducesEmptyOutput) {
    std::vector<double> output{1.0, 2.0};
    dispatch(Relu{}, CallMode::Primal, std::vector<double>{}, output);
    EXPECT_TRUE(output.empty());
}

TEST_F(DispatchTest, PrimalOverBuffersZeroesOutputGrad) {
    DifferentiableBuffer<double> input(std::vector<double>{-3.0, 4.0});
    DifferentiableBuffer<double> output(std::vector<double>{9.0}, std::vector<double>{9.0});
    dispatch(Relu{}, CallMode::Primal, input, output);

    ASSERT_EQ(output.size(), 2u);
    EXPECT_EQ(output.primal()[0], 0.0);
    EXPECT_EQ(output.primal()[1], 4.0);
    EXPECT_EQ(output.grad()[0], 0.0);
    EXPECT_EQ(output.grad()[1], 0.0);
}

// ============================================================================
// Backward Dispatch
// ============================================================================

TEST_F(DispatchTest, BackwardWritesInputGradients) {
    using Sig = nn::Elementwise<nn::Sigmoid<double>, 2>;
    DifferentiableBuffer<double> input(std::vector<double>{0.0, 1.0, -2.0, 3.0});
    DifferentiableBuffer<double> output;
    dispatch(Sig{}, CallMode::Primal, input, output);

    const std::array<double, 4> upstream{1.0, 2.0, 0.5, 0.0};
    std::copy(upstream.begin(), upstream.end(), output.grad().begin());
    dispatch(Sig{}, CallMode::Backward, input, output);

    auto sigmoidGrad = [](double x) {
        const double s = 1.0 / (1.0 + std::exp(-x));
        return s * (1.0 - s);
    };
    EXPECT_NEAR(input.grad()[0], 0.25, 1e-12);
    EXPECT_NEAR(input.grad()[1], 2.0 * sigmoidGrad(1.0), 1e-12);
    EXPECT_NEAR(input.grad()[2], 0.5 * sigmoidGrad(-2.0), 1e-12);
    EXPECT_EQ(input.grad()[3], 0.0);
}

TEST_F(DispatchTest, BackwardAfterPrimalWritesEveryGradientInBounds) {
    DifferentiableBuffer<double> input(std::vector<double>{-1.0, 2.0, 3.0, -4.0});
    DifferentiableBuffer<double> output;
    dispatch(Relu{}, CallMode::Primal, input, output);
    std::fill(output.grad().begin(), output.grad().end(), 1.0);

    dispatch(Relu{}, CallMode::Backward, input, output);

    ASSERT_EQ(input.grad().size(), input.size());
    EXPECT_EQ(input.grad()[0], 0.0);
    EXPECT_EQ(input.grad()[1], 1.0);
    EXPECT_EQ(input.grad()[2], 1.0);
    EXPECT_EQ(input.grad()[3], 0.0);
}

TEST_F(DispatchTest, BackwardThroughEncodingMatchesFiniteDifference) {
    const Encoding encoding;
    DifferentiableBuffer<double> input(std::vector<double>{0.2, -0.4, 0.9, 0.05});
    DifferentiableBuffer<double> output;
    dispatch(encoding, CallMode::Primal, input, output);
    for (auto& g : output.grad()) {
        g = 1.0;
    }
    dispatch(encoding, CallMode::Backward, input, output);

    auto sumOfFeatures = [&](std::vector<double> x) {
        std::vector<double> y;
        dispatch(encoding, CallMode::Primal, x, y);
        double sum = 0.0;
        for (double v : y) {
            sum += v;
        }
        return sum;
    };

    const double h = 1e-6;
    for (std::size_t i = 0; i < input.size(); ++i) {
        std::vector<double> plus(input.primal().begin(), input.primal().end());
        std::vector<double> minus = plus;
        plus[i] += h;
        minus[i] -= h;
        const double numeric = (sumOfFeatures(plus) - sumOfFeatures(minus)) / (2 * h);
        EXPECT_NEAR(input.grad()[i], numeric, 1e-6) << "lane " << i;
    }
}

TEST_F(DispatchTest, BackwardLeavesPrimalUntouched) {
    DifferentiableBuffer<double> input(std::vector<double>{-1.0, 1.0});
    DifferentiableBuffer<double> output(std::vector<double>{0.0, 1.0}, std::vector<double>{3.0, 3.0});
    dispatch(Relu{}, CallMode::Backward, input, output);

    EXPECT_EQ(input.primal()[0], -1.0);
    EXPECT_EQ(input.primal()[1], 1.0);
    EXPECT_EQ(input.grad()[0], 0.0);
    EXPECT_EQ(input.grad()[1], 3.0);
}

// ============================================================================
// Error Handling
// ============================================================================

TEST_F(DispatchTest, InputNotMultipleOfWidthThrows) {
    std::vector<double> output;
    EXPECT_THROW(dispatch(Encoding{}, CallMode::Primal, std::vector<double>{1.0, 2.0, 3.0}, output),
                 std::runtime_error);
}

TEST_F(DispatchTest, BackwardOverPlainVectorsThrows) {
    std::vector<double> output;
    EXPECT_THROW(dispatch(Relu{}, CallMode::Backward, std::vector<double>{1.0, 2.0}, output),
                 std::runtime_error);
}

TEST_F(DispatchTest, BackwardWithMismatchedGroupsThrows) {
    DifferentiableBuffer<double> input(std::vector<double>{1.0, 2.0, 3.0, 4.0});
    DifferentiableBuffer<double> output(2);
    EXPECT_THROW(dispatch(Relu{}, CallMode::Backward, input, output), std::runtime_error);
}

TEST_F(DispatchTest, BackwardWithRaggedOutputThrows) {
    DifferentiableBuffer<double> input(std::vector<double>{0.1, 0.2});
    DifferentiableBuffer<double> output(Encoding::kOutputWidth + 1);
    EXPECT_THROW(dispatch(Encoding{}, CallMode::Backward, input, output), std::runtime_error);
}

TEST_F(DispatchTest, ErrorMessageNamesModule) {
    std::vector<double> output;
    try {
        dispatch(Encoding{}, CallMode::Primal, std::vector<double>{1.0}, output);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("FrequencyEncoding"), std::string::npos);
    }
}
