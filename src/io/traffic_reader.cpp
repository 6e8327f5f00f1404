// File: src/io/traffic_reader.cpp
#include "io/traffic_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <utility>

namespace canforge {

namespace {

std::string Trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

int HexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// CAN FD frames carry at most 64 data bytes
constexpr unsigned long kMaxDlc = 64;

// @throws std::invalid_argument or std::out_of_range on a malformed DLC
uint32_t ParseDlc(const std::string& cell) {
    if (cell.find('-') != std::string::npos) {
        throw std::out_of_range("DLC " + cell + " is negative");
    }
    unsigned long dlc = std::stoul(cell);
    if (dlc > kMaxDlc) {
        throw std::out_of_range("DLC " + cell + " exceeds " + std::to_string(kMaxDlc) + " bytes");
    }
    return static_cast<uint32_t>(dlc);
}

size_t RequireColumn(const std::map<std::string, size_t>& columns, const std::string& name) {
    auto it = columns.find(name);
    if (it == columns.end()) {
        throw std::runtime_error("Traffic CSV header lacks required column '" + name + "'");
    }
    return it->second;
}

} // anonymous namespace

std::vector<std::string> TrafficReader::SplitLine(const std::string& line) {
    std::vector<std::string> cells;
    size_t begin = 0;
    while (true) {
        size_t comma = line.find(',', begin);
        if (comma == std::string::npos) {
            cells.push_back(Trim(line.substr(begin)));
            break;
        }
        cells.push_back(Trim(line.substr(begin, comma - begin)));
        begin = comma + 1;
    }
    return cells;
}

std::string TrafficReader::HexToBinary(const std::string& hex, uint32_t dlc) {
    std::string bits;
    bits.reserve(static_cast<size_t>(dlc) * 8);

    size_t digits = 0;
    for (char c : hex) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        int value = HexDigitValue(c);
        if (value < 0) {
            throw std::invalid_argument("Invalid hex character '" + std::string(1, c) +
                                        "' in payload '" + hex + "'");
        }
        for (int shift = 3; shift >= 0; --shift) {
            bits.push_back(((value >> shift) & 1) ? '1' : '0');
        }
        ++digits;
    }

    if (digits % 2 != 0) {
        throw std::invalid_argument("Payload '" + hex + "' has an odd number of hex digits");
    }
    if (digits / 2 > dlc) {
        throw std::invalid_argument("Payload '" + hex + "' is longer than DLC " +
                                    std::to_string(dlc));
    }

    bits.resize(static_cast<size_t>(dlc) * 8, '0');
    return bits;
}

std::vector<TrafficRecord> TrafficReader::LoadFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open traffic file: " + filepath);
    }
    return LoadStream(file);
}

std::vector<TrafficRecord> TrafficReader::LoadStream(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Traffic CSV is empty");
    }

    std::map<std::string, size_t> columns;
    std::vector<std::string> header = SplitLine(line);
    for (size_t i = 0; i < header.size(); ++i) {
        if (!header[i].empty()) {
            columns[header[i]] = i;
        }
    }

    const size_t timestamp_col = RequireColumn(columns, "Timestamp");
    const size_t id_col = RequireColumn(columns, "ID");
    const size_t dlc_col = RequireColumn(columns, "DLC");
    const size_t data_col = RequireColumn(columns, "Data");
    auto bin_it = columns.find("DataBin");
    const bool has_bin = bin_it != columns.end();

    std::vector<TrafficRecord> records;
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (Trim(line).empty()) {
            continue;
        }

        std::vector<std::string> cells = SplitLine(line);
        if (cells.size() < header.size()) {
            throw std::runtime_error("Traffic CSV line " + std::to_string(line_number) +
                                     " has " + std::to_string(cells.size()) +
                                     " columns, expected " + std::to_string(header.size()));
        }

        TrafficRecord record;
        try {
            record.timestamp = std::stod(cells[timestamp_col]);
            record.id = cells[id_col];
            record.dlc = ParseDlc(cells[dlc_col]);
            record.data_hex = cells[data_col];
            if (has_bin && !cells[bin_it->second].empty()) {
                record.data_bin = cells[bin_it->second];
            } else {
                record.data_bin = HexToBinary(record.data_hex, record.dlc);
            }
        } catch (const std::logic_error& e) {
            // std::invalid_argument and std::out_of_range from parsing
            throw std::runtime_error("Traffic CSV line " + std::to_string(line_number) +
                                     ": " + e.what());
        }

        records.push_back(std::move(record));
    }

    return records;
}

std::vector<TrafficRecord> TrafficReader::FilterById(const std::vector<TrafficRecord>& records,
                                                     const std::string& can_id) {
    std::vector<TrafficRecord> filtered;
    std::copy_if(records.begin(), records.end(), std::back_inserter(filtered),
                 [&can_id](const TrafficRecord& record) { return record.id == can_id; });
    return filtered;
}

} // namespace canforge
