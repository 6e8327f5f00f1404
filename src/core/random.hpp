// File: src/core/random.hpp
#pragma once

#include <cstdint>
#include <random>

namespace canforge {

// Random engine for a configured seed; seed 0 draws one from std::random_device
std::mt19937 CreateRandomEngine(uint32_t seed);

} // namespace canforge
