// File: tests/io/traffic_reader_test.cpp
#include "io/traffic_reader.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace canforge {
namespace {

// ============================================================================
// Hex Decoding
// ============================================================================

TEST(HexToBinaryTest, FourBitsPerDigitMsbFirst) {
    EXPECT_EQ("10100101", TrafficReader::HexToBinary("A5", 1));
    EXPECT_EQ("0000000111111111", TrafficReader::HexToBinary("01ff", 2));
}

TEST(HexToBinaryTest, SpacesBetweenBytesAreIgnored) {
    EXPECT_EQ(TrafficReader::HexToBinary("12 34 56", 3), TrafficReader::HexToBinary("123456", 3));
}

TEST(HexToBinaryTest, ShortPayloadIsPaddedToDlc) {
    std::string bits = TrafficReader::HexToBinary("FF", 4);
    ASSERT_EQ(32u, bits.size());
    EXPECT_EQ("11111111" + std::string(24, '0'), bits);
    EXPECT_EQ(std::string(16, '0'), TrafficReader::HexToBinary("", 2));
}

TEST(HexToBinaryTest, MalformedPayloadThrows) {
    EXPECT_THROW(TrafficReader::HexToBinary("ABC", 2), std::invalid_argument);
    EXPECT_THROW(TrafficReader::HexToBinary("G0", 1), std::invalid_argument);
    EXPECT_THROW(TrafficReader::HexToBinary("0102", 1), std::invalid_argument);
}

// ============================================================================
// CSV Loading
// ============================================================================

TEST(TrafficReaderTest, LoadsHeaderDrivenColumns) {
    std::istringstream csv(
        ",Timestamp,ID,DLC,Data\n"
        "0,0.000,0DE,2,A501\n"
        "1,0.005,1A0,1,FF\n"
        "2,0.010,0DE,2,A502\n");

    auto records = TrafficReader::LoadStream(csv);
    ASSERT_EQ(3u, records.size());

    EXPECT_DOUBLE_EQ(0.005, records[1].timestamp);
    EXPECT_EQ("1A0", records[1].id);
    EXPECT_EQ(1u, records[1].dlc);
    EXPECT_EQ("FF", records[1].data_hex);
    EXPECT_EQ("11111111", records[1].data_bin);
    EXPECT_EQ("1010010100000010", records[2].data_bin);
}

TEST(TrafficReaderTest, PrecomputedBinaryColumnIsUsed) {
    std::istringstream csv(
        "ID,Timestamp,Data,DLC,DataBin\n"
        "0DE,1.5,00,1,10000001\n"
        "0DE,1.6,0F,1,\n");

    auto records = TrafficReader::LoadStream(csv);
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("10000001", records[0].data_bin);
    EXPECT_EQ("00001111", records[1].data_bin);
}

TEST(TrafficReaderTest, BlankLinesAreSkipped) {
    std::istringstream csv("Timestamp,ID,DLC,Data\n\n0.0,0DE,1,01\n   \n");
    EXPECT_EQ(1u, TrafficReader::LoadStream(csv).size());
}

TEST(TrafficReaderTest, MissingColumnThrows) {
    std::istringstream csv("Timestamp,ID,Data\n0.0,0DE,01\n");
    EXPECT_THROW(TrafficReader::LoadStream(csv), std::runtime_error);
}

TEST(TrafficReaderTest, EmptyInputThrows) {
    std::istringstream csv("");
    EXPECT_THROW(TrafficReader::LoadStream(csv), std::runtime_error);
}

TEST(TrafficReaderTest, MalformedRowReportsLine) {
    std::istringstream csv(
        "Timestamp,ID,DLC,Data\n"
        "0.0,0DE,1,01\n"
        "0.1,0DE,x,01\n");

    try {
        TrafficReader::LoadStream(csv);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("line 3"));
    }
}

TEST(TrafficReaderTest, NegativeDlcReportsLine) {
    std::istringstream csv(",Timestamp,ID,DLC,Data\n0,0.0,0DE,-1,A5\n");

    try {
        TrafficReader::LoadStream(csv);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("line 2"));
    }
}

TEST(TrafficReaderTest, DlcAboveCanFdMaximumReportsLine) {
    std::istringstream csv(",Timestamp,ID,DLC,Data\n0,0.0,0DE,64,A5\n1,0.1,0DE,65,A5\n");

    try {
        TrafficReader::LoadStream(csv);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("line 3"));
    }
}

TEST(TrafficReaderTest, ShortRowThrows) {
    std::istringstream csv("Timestamp,ID,DLC,Data\n0.0,0DE\n");
    EXPECT_THROW(TrafficReader::LoadStream(csv), std::runtime_error);
}

TEST(TrafficReaderTest, LoadFile) {
    std::string path = "/tmp/test_canforge_traffic.csv";
    {
        std::ofstream out(path);
        out << ",Timestamp,ID,DLC,Data\n0,0.0,0DE,1,80\n";
    }

    auto records = TrafficReader::LoadFile(path);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("10000000", records[0].data_bin);
    std::filesystem::remove(path);
}

TEST(TrafficReaderTest, MissingFileThrows) {
    EXPECT_THROW(TrafficReader::LoadFile("/tmp/does_not_exist_canforge.csv"), std::runtime_error);
}

// ============================================================================
// Filtering
// ============================================================================

TEST(TrafficReaderTest, FilterByIdKeepsOrder) {
    std::vector<TrafficRecord> records(5);
    const char* ids[] = {"0DE", "1A0", "0DE", "0DF", "0DE"};
    for (size_t i = 0; i < records.size(); ++i) {
        records[i].id = ids[i];
        records[i].timestamp = static_cast<double>(i);
    }

    auto filtered = TrafficReader::FilterById(records, "0DE");
    ASSERT_EQ(3u, filtered.size());
    EXPECT_DOUBLE_EQ(0.0, filtered[0].timestamp);
    EXPECT_DOUBLE_EQ(2.0, filtered[1].timestamp);
    EXPECT_DOUBLE_EQ(4.0, filtered[2].timestamp);
    EXPECT_TRUE(TrafficReader::FilterById(records, "7FF").empty());
}

TEST(TrafficReaderTest, SplitLineTrimsCells) {
    auto cells = TrafficReader::SplitLine(" a, b ,,c ");
    EXPECT_EQ((std::vector<std::string>{"a", "b", "", "c"}), cells);
}

} // namespace
} // namespace canforge
