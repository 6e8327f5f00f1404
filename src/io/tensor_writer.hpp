// File: src/io/tensor_writer.hpp
#pragma once

#include "core/sequence_tensor.hpp"
#include <ostream>
#include <string>

namespace canforge {

/// Write a tensor as CSV rows "sequence,word,bits"
///
/// The first line is the header "sequence,word,bits"; bits are written as a
/// '0'/'1' string, one row per word in sequence-major order.
void WriteTensorCsv(const SequenceTensor& sequences, std::ostream& out);

/// Write a tensor to a CSV file
/// @return true if the whole file was written, false on an I/O error
bool SaveTensorCsv(const SequenceTensor& sequences, const std::string& filepath);

} // namespace canforge
