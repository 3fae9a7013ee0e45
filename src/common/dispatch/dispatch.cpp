#include "difflane/dispatch/dispatch.h"

#include <format>
#include <stdexcept>

#include "difflane/logger.h"

namespace difflane {
namespace detail {

std::size_t laneGroups(std::size_t length, std::size_t width, std::string_view moduleName,
                       std::string_view bufferName) {
    if (length % width != 0) {
        dispatchError(std::format("{}: {} buffer has {} elements, not a multiple of width {}",
                                  moduleName, bufferName, length, width));
    }
    return length / width;
}

void dispatchError(const std::string& message) {
    Logger::getInstance("Dispatch").error(message);
    throw std::runtime_error(message);
}

void logDispatch(CallMode mode, std::string_view moduleName, std::size_t groups) {
    Logger::getInstance("Dispatch").debug("{} dispatch of {} over {} lane groups", toString(mode),
                                          moduleName, groups);
}

}  // namespace detail
}  // namespace difflane
