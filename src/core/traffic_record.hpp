// File: src/core/traffic_record.hpp
#pragma once

#include <cstdint>
#include <string>

namespace canforge {

// TrafficRecord: One decoded bus message, kept in arrival order
struct TrafficRecord {
    // Arrival time in seconds
    double timestamp{0.0};

    // Message identifier, e.g. "0DE"
    std::string id;

    // Payload length in bytes
    uint32_t dlc{0};

    // Payload as hex text
    std::string data_hex;

    // Payload as a binary string, 8 * dlc characters of '0'/'1'
    std::string data_bin;
};

} // namespace canforge
