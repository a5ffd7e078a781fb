#include <gtest/gtest.h>
#include "../src/core/AliasStore.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace plug_scan {

class AliasStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("plug_scan_alias_" + std::to_string(::getpid()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        path_ = (dir_ / "state" / "aliases.json").string();
    }
    void TearDown() override { fs::remove_all(dir_); }

    nlohmann::json read_file() {
        std::ifstream in(path_);
        return nlohmann::json::parse(in);
    }
    void write_file(const std::string& text) {
        fs::create_directories(fs::path(path_).parent_path());
        std::ofstream out(path_);
        out << text;
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(AliasStoreTest, MissingFileIsEmpty) {
    AliasStore store(path_);
    EXPECT_TRUE(store.load());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(AliasStoreTest, SetPersistsAndCreatesDirectories) {
    AliasStore store(path_);
    ASSERT_TRUE(store.load());
    store.set("uuid:a", "Desk Lamp");
    store.set("uuid:b", "Heater");
    ASSERT_TRUE(fs::exists(path_));
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
    nlohmann::json j = read_file();
    EXPECT_EQ(j["uuid:a"], "Desk Lamp");
    EXPECT_EQ(j["uuid:b"], "Heater");

    AliasStore reloaded(path_);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get("uuid:a").value_or(""), "Desk Lamp");
    EXPECT_EQ(reloaded.size(), 2u);
}

TEST_F(AliasStoreTest, RemoveAndRemoveAll) {
    AliasStore store(path_);
    store.set("uuid:a", "A");
    store.set("uuid:b", "B");
    store.set("uuid:c", "C");
    EXPECT_TRUE(store.remove("uuid:a"));
    EXPECT_FALSE(store.remove("uuid:a"));
    EXPECT_EQ(store.remove_all({"uuid:b", "uuid:c", "uuid:zzz"}), 2u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(read_file().empty());
}

TEST_F(AliasStoreTest, MalformedFileIsIgnored) {
    write_file("{ not json");
    AliasStore store(path_);
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(AliasStoreTest, NonStringValuesAreSkipped) {
    write_file(R"({"uuid:a": "Lamp", "uuid:b": 7, "uuid:c": ""})");
    AliasStore store(path_);
    EXPECT_TRUE(store.load());
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("uuid:a").value_or(""), "Lamp");
    EXPECT_FALSE(store.get("uuid:b").has_value());
}

TEST_F(AliasStoreTest, WrongTopLevelTypeIsIgnored) {
    write_file(R"(["uuid:a"])");
    AliasStore store(path_);
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(AliasStoreTest, MemoryOnlyStore) {
    AliasStore store;
    EXPECT_TRUE(store.load());
    store.set("uuid:a", "Lamp");
    EXPECT_EQ(store.get("uuid:a").value_or(""), "Lamp");
    EXPECT_TRUE(store.path().empty());
}

} // namespace plug_scan
