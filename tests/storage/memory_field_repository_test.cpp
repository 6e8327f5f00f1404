// File: tests/storage/memory_field_repository_test.cpp
#include "storage/memory_field_repository.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace canforge {
namespace {

std::vector<Field> CreateTestLayout(size_t sensor_start = 8) {
    Field header;
    header.start_bit = 0;
    header.length = sensor_start - 1;
    header.type = FieldType::CONST;
    header.n_values = 1;

    Field sensor;
    sensor.start_bit = sensor_start;
    sensor.length = 63 - sensor_start;
    sensor.type = FieldType::SENSOR;
    sensor.category = FieldVariability::HIGH_VAR;
    sensor.n_values = 240;

    return {header, sensor};
}

TEST(MemoryFieldRepositoryTest, StoreAndRetrieve) {
    MemoryFieldRepository repository;
    auto layout = CreateTestLayout();

    EXPECT_TRUE(repository.Store("0DE", layout));
    auto retrieved = repository.Retrieve("0DE");
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(layout, *retrieved);
}

TEST(MemoryFieldRepositoryTest, RetrieveUnknownId) {
    MemoryFieldRepository repository;
    EXPECT_FALSE(repository.Retrieve("7FF").has_value());
}

TEST(MemoryFieldRepositoryTest, StoreDoesNotOverwrite) {
    MemoryFieldRepository repository;
    EXPECT_TRUE(repository.Store("0DE", CreateTestLayout(8)));
    EXPECT_FALSE(repository.Store("0DE", CreateTestLayout(16)));
    EXPECT_EQ(8u, repository.Retrieve("0DE")->at(1).start_bit);
}

TEST(MemoryFieldRepositoryTest, UpsertReplaces) {
    MemoryFieldRepository repository;
    EXPECT_TRUE(repository.Upsert("0DE", CreateTestLayout(8)));
    EXPECT_TRUE(repository.Upsert("0DE", CreateTestLayout(16)));
    EXPECT_EQ(16u, repository.Retrieve("0DE")->at(1).start_bit);
    EXPECT_EQ(1u, repository.Count());
}

TEST(MemoryFieldRepositoryTest, EmptyLayoutRejected) {
    MemoryFieldRepository repository;
    EXPECT_FALSE(repository.Store("0DE", {}));
    EXPECT_FALSE(repository.Upsert("0DE", {}));
    EXPECT_FALSE(repository.Exists("0DE"));
}

TEST(MemoryFieldRepositoryTest, RemoveExistsAndClear) {
    MemoryFieldRepository repository;
    repository.Store("1A0", CreateTestLayout());
    repository.Store("0DE", CreateTestLayout());

    EXPECT_TRUE(repository.Exists("1A0"));
    EXPECT_EQ((std::vector<std::string>{"0DE", "1A0"}), repository.ListIds());

    EXPECT_TRUE(repository.Remove("1A0"));
    EXPECT_FALSE(repository.Remove("1A0"));
    EXPECT_FALSE(repository.Exists("1A0"));
    EXPECT_EQ(1u, repository.Count());

    repository.Clear();
    EXPECT_EQ(0u, repository.Count());
    EXPECT_TRUE(repository.ListIds().empty());
}

TEST(MemoryFieldRepositoryTest, ConcurrentStores) {
    MemoryFieldRepository repository;
    constexpr int kNumThreads = 8;
    constexpr int kIdsPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kNumThreads; ++t) {
        threads.emplace_back([&repository, t]() {
            for (int i = 0; i < kIdsPerThread; ++i) {
                repository.Store(std::to_string(t * kIdsPerThread + i), CreateTestLayout());
                repository.Retrieve(std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<size_t>(kNumThreads * kIdsPerThread), repository.Count());
}

} // namespace
} // namespace canforge
