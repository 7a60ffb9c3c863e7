// Fixed per-tick time information handed to every system.
#pragma once

#include <cstdint>

namespace Engine {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};  // simulation time at the end of this tick
    std::uint64_t tickIndex{0};
};

}  // namespace Engine
