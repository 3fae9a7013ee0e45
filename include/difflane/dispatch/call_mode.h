#pragma once

#include <string_view>

namespace difflane {

// What a dispatch computes for every lane group
enum class CallMode {
    Primal,    // forward values
    Backward,  // input gradients from output gradients
};

std::string_view toString(CallMode mode);

}  // namespace difflane
