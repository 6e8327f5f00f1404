// File: src/anomaly/donor_rotation.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace canforge {

/// Donor sequence for the step-th substitution of a rotating donor counter
///
/// The counter starts at `start`, advances by one per substitution and
/// wraps to 0 when it reaches `num_sequences`. A negative start behaves
/// like a negative index, counting back from the last sequence.
///
/// @param start Initial counter value
/// @param step Number of substitutions already performed
/// @param num_sequences Number of sequences in the tensor (must be > 0)
/// @throws std::invalid_argument if num_sequences is 0
size_t DonorIndex(int64_t start, size_t step, size_t num_sequences);

/// Precompute the first `count` donor indices of a rotation
std::vector<size_t> DonorIndices(int64_t start, size_t count, size_t num_sequences);

} // namespace canforge
