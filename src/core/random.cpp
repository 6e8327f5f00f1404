// File: src/core/random.cpp
#include "core/random.hpp"

namespace canforge {

std::mt19937 CreateRandomEngine(uint32_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(seed);
}

} // namespace canforge
