#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MemoryStorageAdapter.hpp"
#include "FileStorageAdapter.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace mcpperf;
using namespace std::chrono_literals;

class MemoryStorageAdapterTest : public ::testing::Test {
protected:
    MemoryStorageAdapter storage_;
};

TEST_F(MemoryStorageAdapterTest, SetAndGet) {
    storage_.set("tools", Json{{"name", "echo"}}, 0ms);

    auto value = storage_.get("tools");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["name"], "echo");
}

TEST_F(MemoryStorageAdapterTest, GetMissing) {
    EXPECT_FALSE(storage_.get("prompts").has_value());
}

TEST_F(MemoryStorageAdapterTest, ValueExpires) {
    storage_.set("tools", Json::array(), 20ms);
    EXPECT_TRUE(storage_.get("tools").has_value());

    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(storage_.get("tools").has_value());
    EXPECT_EQ(storage_.size(), 0u);
}

TEST_F(MemoryStorageAdapterTest, RemoveAndClear) {
    storage_.set("tools", 1, 0ms);
    storage_.set("resources", 2, 0ms);
    storage_.set("prompts", 3, 0ms);

    storage_.remove("tools");
    EXPECT_FALSE(storage_.get("tools").has_value());
    EXPECT_EQ(storage_.size(), 2u);

    storage_.clear();
    EXPECT_EQ(storage_.size(), 0u);
}

class FileStorageAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "mcpperf_storage_test";
        std::filesystem::remove_all(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

TEST_F(FileStorageAdapterTest, CreatesDirectory) {
    FileStorageAdapter storage(tempDir_ / "nested");

    EXPECT_TRUE(std::filesystem::is_directory(tempDir_ / "nested"));
}

TEST_F(FileStorageAdapterTest, ValuesSurviveReopen) {
    {
        FileStorageAdapter storage(tempDir_);
        storage.set("tools", Json::array({Json{{"name", "echo"}}}), 60000ms);
        storage.set("prompts", Json::array(), 0ms);
    }

    FileStorageAdapter reopened(tempDir_);
    auto tools = reopened.get("tools");

    ASSERT_TRUE(tools.has_value());
    EXPECT_EQ((*tools)[0]["name"], "echo");
    EXPECT_TRUE(reopened.get("prompts").has_value());
}

TEST_F(FileStorageAdapterTest, WritesLeaveNoTemporaryFile) {
    FileStorageAdapter storage(tempDir_);
    storage.set("tools", Json::array(), 0ms);

    EXPECT_TRUE(std::filesystem::exists(storage.path()));
    auto temp = storage.path();
    temp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp));
}

TEST_F(FileStorageAdapterTest, ExpiredValueDroppedOnRead) {
    FileStorageAdapter storage(tempDir_);
    storage.set("tools", Json::array(), 20ms);

    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(storage.get("tools").has_value());

    FileStorageAdapter reopened(tempDir_);
    EXPECT_FALSE(reopened.get("tools").has_value());
}

TEST_F(FileStorageAdapterTest, RemoveAndClearPersist) {
    {
        FileStorageAdapter storage(tempDir_);
        storage.set("tools", 1, 0ms);
        storage.set("resources", 2, 0ms);
        storage.remove("tools");
    }
    {
        FileStorageAdapter storage(tempDir_);
        EXPECT_FALSE(storage.get("tools").has_value());
        EXPECT_TRUE(storage.get("resources").has_value());
        storage.clear();
    }

    FileStorageAdapter storage(tempDir_);
    EXPECT_FALSE(storage.get("resources").has_value());
}

TEST_F(FileStorageAdapterTest, CorruptDocumentStartsEmpty) {
    std::filesystem::create_directories(tempDir_);
    {
        std::ofstream file(tempDir_ / "definitions.json");
        file << "{ not json";
    }

    FileStorageAdapter storage(tempDir_);

    EXPECT_FALSE(storage.get("tools").has_value());
    storage.set("tools", 1, 0ms);
    EXPECT_TRUE(storage.get("tools").has_value());
}
