#include <array>
#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "difflane/autograd/node.h"
#include "difflane/dispatch/dispatch.h"
#include "difflane/logger.h"
#include "difflane/nn/activation.h"
#include "difflane/nn/activations.h"
#include "difflane/nn/frequency_encoding.h"

using difflane::CallMode;
using difflane::DifferentiableBuffer;
using difflane::Logger;
using difflane::LogLevel;
using difflane::LogOutput;

namespace {

std::string join(std::span<const float> values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::format("{:.4f}", values[i]);
    }
    return out;
}

void configureLogging() {
    Logger::setLogOutput(LogOutput::CONSOLE);
    if (const char* level = std::getenv("DIFFLANE_LOG_LEVEL")) {
        Logger::setMinLogLevel(difflane::parseLogLevel(level));
    }
}

}  // namespace

int main() {
    try {
        configureLogging();
    } catch (const std::exception& e) {
        std::cerr << "difflane_demo: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    auto& logger = Logger::getInstance("Demo");
    logger.info("difflane demo: 2D points -> frequency encoding -> sigmoid");

    using Encoding = difflane::nn::FrequencyEncoding<float, 2, 3>;
    using Squash = difflane::nn::Elementwise<difflane::nn::Sigmoid<float>, Encoding::kOutputWidth>;

    const Encoding encoding{};
    const Squash sigmoid{};

    logger.info("encoding: {} -> {} lanes, sigmoid recompute hint: {}", Encoding::kInputWidth,
                Encoding::kOutputWidth, difflane::autograd::prefersRecompute<Squash>);

    int status = EXIT_SUCCESS;
    try {
        // Three points, two coordinates each
        DifferentiableBuffer<float> points(std::vector<float>{0.25f, 0.5f, -0.1f, 0.8f, 1.0f, 0.0f});
        DifferentiableBuffer<float> features;
        DifferentiableBuffer<float> activated;

        difflane::dispatch(encoding, CallMode::Primal, points, features);
        difflane::dispatch(sigmoid, CallMode::Primal, features, activated);
        const std::vector<float> first(activated.primal().begin(),
                                       activated.primal().begin() + Encoding::kOutputWidth);
        logger.info("activated[0..{}): [{}]", Encoding::kOutputWidth, join(first));

        // d(sum of outputs)/d(points)
        for (auto& g : activated.grad()) {
            g = 1.0f;
        }
        difflane::dispatch(sigmoid, CallMode::Backward, features, activated);
        difflane::dispatch(encoding, CallMode::Backward, points, features);
        logger.info("d(sum)/d(points): [{}]", join(points.grad()));

        // The same first point through recorded backward nodes
        const auto encoded = difflane::autograd::record(encoding, {0.25f, 0.5f});
        const auto squashed = difflane::autograd::record(sigmoid, encoded.output);
        logger.info("{} saves output: {}, {} saves output: {}", squashed.gradFn->name(),
                    squashed.gradFn->savesOutput(), encoded.gradFn->name(),
                    encoded.gradFn->savesOutput());

        std::array<float, Encoding::kOutputWidth> ones{};
        ones.fill(1.0f);
        const auto grad = encoded.gradFn->backward(squashed.gradFn->backward(ones));
        logger.info("recorded d(sum)/d(point 0): [{}, {}]", grad[0], grad[1]);
    } catch (const std::exception& e) {
        logger.error("demo failed: {}", e.what());
        status = EXIT_FAILURE;
    }

    Logger::flush();
    Logger::shutdown();
    return status;
}
