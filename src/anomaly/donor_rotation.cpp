// File: src/anomaly/donor_rotation.cpp
#include "anomaly/donor_rotation.hpp"
#include <stdexcept>

namespace canforge {

size_t DonorIndex(int64_t start, size_t step, size_t num_sequences) {
    if (num_sequences == 0) {
        throw std::invalid_argument("Donor rotation requires at least one sequence");
    }

    const int64_t n = static_cast<int64_t>(num_sequences);
    int64_t first = start % n;
    if (first < 0) {
        first += n;
    }
    return static_cast<size_t>((static_cast<uint64_t>(first) + step) % num_sequences);
}

std::vector<size_t> DonorIndices(int64_t start, size_t count, size_t num_sequences) {
    std::vector<size_t> indices;
    indices.reserve(count);
    for (size_t step = 0; step < count; ++step) {
        indices.push_back(DonorIndex(start, step, num_sequences));
    }
    return indices;
}

} // namespace canforge
