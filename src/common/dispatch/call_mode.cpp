#include "difflane/dispatch/call_mode.h"

namespace difflane {

std::string_view toString(CallMode mode) {
    switch (mode) {
        case CallMode::Primal:
            return "primal";
        case CallMode::Backward:
            return "backward";
    }
    return "unknown";
}

}  // namespace difflane
