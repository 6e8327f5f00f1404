// File: src/io/tensor_writer.cpp
#include "io/tensor_writer.hpp"
#include <fstream>
#include <iostream>

namespace canforge {

void WriteTensorCsv(const SequenceTensor& sequences, std::ostream& out) {
    out << "sequence,word,bits\n";
    for (size_t seq = 0; seq < sequences.NumSequences(); ++seq) {
        for (size_t word = 0; word < sequences.WordsPerSequence(); ++word) {
            out << seq << ',' << word << ',' << WordToBitString(sequences.GetWord(seq, word)) << '\n';
        }
    }
}

bool SaveTensorCsv(const SequenceTensor& sequences, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    WriteTensorCsv(sequences, file);
    file.flush();
    return static_cast<bool>(file);
}

} // namespace canforge
