#include "rup/storage/key_value_store.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

using namespace rup::storage;
using rup::ErrorCode;

TEST(MemoryKeyValueStore, PutGetRemove) {
    MemoryKeyValueStore store;
    ASSERT_TRUE(store.put("a", "alpha").is_ok());
    ASSERT_TRUE(store.put("b", "beta").is_ok());

    EXPECT_EQ(store.get("a").value(), "alpha");
    EXPECT_EQ(store.keys().value(), (std::vector<std::string>{"a", "b"}));

    ASSERT_TRUE(store.remove("a").is_ok());
    ASSERT_TRUE(store.remove("a").is_ok());
    auto missing = store.get("a");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(MemoryKeyValueStore, QuotaRejectsGrowthButAllowsShrinking) {
    MemoryKeyValueStore store(10);
    ASSERT_TRUE(store.put("a", "12345678").is_ok());

    auto over = store.put("b", "123");
    ASSERT_TRUE(over.is_error());
    EXPECT_EQ(over.error().code, ErrorCode::Storage);
    EXPECT_EQ(store.used_bytes(), 8u);

    // Replacing a value only counts the difference
    EXPECT_TRUE(store.put("a", "1234567890").is_ok());
    EXPECT_TRUE(store.put("a", "1").is_ok());
    EXPECT_TRUE(store.put("b", "123").is_ok());
    EXPECT_EQ(store.used_bytes(), 4u);
}

TEST(FileKeyValueStore, PersistsAcrossInstances) {
    rup::testing::TempDir dir;
    {
        FileKeyValueStore store(dir.path() / "sessions");
        ASSERT_TRUE(store.put("upload-1", "{\"x\":1}").is_ok());
        ASSERT_TRUE(store.put("upload-1", "{\"x\":2}").is_ok());
    }

    FileKeyValueStore reopened(dir.path() / "sessions");
    EXPECT_EQ(reopened.get("upload-1").value(), "{\"x\":2}");
    EXPECT_EQ(reopened.keys().value(), (std::vector<std::string>{"upload-1"}));
}

TEST(FileKeyValueStore, LeavesNoTemporaryFiles) {
    rup::testing::TempDir dir;
    FileKeyValueStore store(dir.path());
    ASSERT_TRUE(store.put("k", "v").is_ok());

    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_NE(entry.path().extension(), ".tmp");
    }
}

TEST(FileKeyValueStore, EscapesUnsafeKeys) {
    EXPECT_EQ(FileKeyValueStore::escape_key("abc-1_2.x"), "abc-1_2.x");
    EXPECT_EQ(FileKeyValueStore::escape_key("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(FileKeyValueStore::escape_key(".hidden"), "%2Ehidden");
    EXPECT_EQ(FileKeyValueStore::unescape_key("a%2Fb%20c"), "a/b c");

    rup::testing::TempDir dir;
    FileKeyValueStore store(dir.path());
    const std::string key = "../escape/attempt";
    ASSERT_TRUE(store.put(key, "payload").is_ok());
    EXPECT_EQ(store.get(key).value(), "payload");
    EXPECT_EQ(store.keys().value(), (std::vector<std::string>{key}));
    EXPECT_FALSE(std::filesystem::exists(dir.path().parent_path() / "escape"));
}

TEST(FileKeyValueStore, IgnoresForeignFiles) {
    rup::testing::TempDir dir;
    FileKeyValueStore store(dir.path());
    ASSERT_TRUE(store.put("k", "v").is_ok());
    std::ofstream(dir.path() / "notes.txt") << "hello";

    EXPECT_EQ(store.keys().value(), (std::vector<std::string>{"k"}));
}

TEST(FileKeyValueStore, MissingKeyIsNotFound) {
    rup::testing::TempDir dir;
    FileKeyValueStore store(dir.path());

    auto missing = store.get("nope");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store.remove("nope").is_ok());
}
