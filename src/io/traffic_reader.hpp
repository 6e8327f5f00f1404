// File: src/io/traffic_reader.hpp
#pragma once

#include "core/traffic_record.hpp"
#include <istream>
#include <string>
#include <vector>

namespace canforge {

/// TrafficReader - loads decoded bus traffic from a CSV dump
///
/// The first line is a header naming the columns. Required columns are
/// Timestamp, ID, DLC and Data (hex payload, bytes optionally separated by
/// spaces); an optional DataBin column carries the payload as a binary
/// string. Any other column, including a leading unnamed index column, is
/// ignored. Records are returned in file order.
class TrafficReader {
public:
    /// Load every record of a CSV file
    /// @throws std::runtime_error if the file cannot be opened, the header
    ///         lacks a required column or a row is malformed
    static std::vector<TrafficRecord> LoadFile(const std::string& filepath);

    /// Load every record of a CSV stream
    static std::vector<TrafficRecord> LoadStream(std::istream& in);

    /// Records of one identifier, in their original order
    static std::vector<TrafficRecord> FilterById(const std::vector<TrafficRecord>& records,
                                                 const std::string& can_id);

    /// Convert a hex payload ("0A FF 10" or "0AFF10") to a binary string
    /// of `dlc` bytes, zero-padded on the right
    /// @throws std::invalid_argument on non-hex characters or a payload
    ///         longer than dlc bytes
    static std::string HexToBinary(const std::string& hex, uint32_t dlc);

    /// Split one CSV line on commas (no quoting)
    static std::vector<std::string> SplitLine(const std::string& line);
};

} // namespace canforge
