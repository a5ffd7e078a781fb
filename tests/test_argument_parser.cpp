#include <gtest/gtest.h>
#include "../src/core/ArgumentParser.h"
#include "../src/core/Config.h"
#include <sstream>
#include <iostream>

namespace plug_scan {

class ArgumentParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        old_cout_ = std::cout.rdbuf(out_.rdbuf());
        old_cerr_ = std::cerr.rdbuf(err_.rdbuf());
    }
    void TearDown() override {
        std::cout.rdbuf(old_cout_);
        std::cerr.rdbuf(old_cerr_);
    }

    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "plug-scan");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        return parser_.parse(static_cast<int>(args.size()), argv.data(), cfg_);
    }

    ArgumentParser parser_;
    Config cfg_;
    std::stringstream out_;
    std::stringstream err_;
    std::streambuf* old_cout_ = nullptr;
    std::streambuf* old_cerr_ = nullptr;
};

TEST_F(ArgumentParserTest, DefaultsWithoutArguments) {
    EXPECT_TRUE(parse({}));
    EXPECT_FALSE(parser_.early_exit());
    EXPECT_EQ(cfg_.control_port, 49153);
    EXPECT_EQ(cfg_.scan_concurrency, 50);
    EXPECT_EQ(cfg_.discovery_interval_s, 300);
    EXPECT_TRUE(cfg_.broadcast);
    EXPECT_TRUE(cfg_.auto_discovery);
    EXPECT_TRUE(cfg_.network.empty());
}

TEST_F(ArgumentParserTest, DiscoveryFlags) {
    EXPECT_TRUE(parse({"--network", "192.168.1.0/24", "--scan", "--no-broadcast", "--address", "10.0.0.5,10.0.0.6",
                       "--port", "49154", "--probe-timeout", "500", "--scan-concurrency", "20", "--no-verify", "--parallel"}));
    EXPECT_EQ(cfg_.network, "192.168.1.0/24");
    EXPECT_TRUE(cfg_.scan);
    EXPECT_FALSE(cfg_.broadcast);
    ASSERT_EQ(cfg_.addresses.size(), 2u);
    EXPECT_EQ(cfg_.addresses[1], "10.0.0.6");
    EXPECT_EQ(cfg_.control_port, 49154);
    EXPECT_EQ(cfg_.probe_timeout_ms, 500);
    EXPECT_EQ(cfg_.scan_concurrency, 20);
    EXPECT_FALSE(cfg_.verify_signature);
    EXPECT_TRUE(cfg_.parallel);
}

TEST_F(ArgumentParserTest, StatusAndBackgroundFlags) {
    EXPECT_TRUE(parse({"--status-timeout", "1000", "--status-concurrency", "4", "--status-deadline", "3000",
                       "--interval", "60", "--no-auto-discovery", "--watch", "5", "--alias-file", ""}));
    EXPECT_EQ(cfg_.status_timeout_ms, 1000);
    EXPECT_EQ(cfg_.status_concurrency, 4);
    EXPECT_EQ(cfg_.status_deadline_ms, 3000);
    EXPECT_EQ(cfg_.discovery_interval_s, 60);
    EXPECT_FALSE(cfg_.auto_discovery);
    EXPECT_EQ(cfg_.watch_interval_s, 5);
    EXPECT_TRUE(cfg_.alias_file.empty());
}

TEST_F(ArgumentParserTest, OutputFlags) {
    EXPECT_TRUE(parse({"--pretty", "--progress", "--log-level", "debug", "--output", "/tmp/out.json", "--drop-priv", "--validate", "10.0.0.0/8"}));
    EXPECT_TRUE(cfg_.pretty);
    EXPECT_TRUE(cfg_.progress);
    EXPECT_EQ(cfg_.log_level, "debug");
    EXPECT_EQ(cfg_.output_file, "/tmp/out.json");
    EXPECT_TRUE(cfg_.drop_priv);
    EXPECT_EQ(cfg_.validate_network, "10.0.0.0/8");
}

TEST_F(ArgumentParserTest, UnknownFlagFails) {
    EXPECT_FALSE(parse({"--frobnicate"}));
    EXPECT_FALSE(parser_.early_exit());
    EXPECT_NE(err_.str().find("Unknown arg: --frobnicate"), std::string::npos);
}

TEST_F(ArgumentParserTest, MissingValueFails) {
    EXPECT_FALSE(parse({"--network"}));
    EXPECT_NE(err_.str().find("Missing value for --network"), std::string::npos);
}

TEST_F(ArgumentParserTest, BadIntegerFails) {
    EXPECT_FALSE(parse({"--port", "49153x"}));
    EXPECT_NE(err_.str().find("Invalid integer for --port"), std::string::npos);
    EXPECT_FALSE(parse({"--interval", "soon"}));
}

TEST_F(ArgumentParserTest, HelpAndVersionExitEarly) {
    EXPECT_FALSE(parse({"--help"}));
    EXPECT_TRUE(parser_.early_exit());
    EXPECT_NE(out_.str().find("--network VALUE"), std::string::npos);
    EXPECT_NE(out_.str().find("--watch N"), std::string::npos);

    out_.str("");
    EXPECT_FALSE(parse({"--version"}));
    EXPECT_TRUE(parser_.early_exit());
    EXPECT_EQ(out_.str().rfind("plug-scan ", 0), 0u);
}

TEST(SplitCsvTest, DropsEmptyItems) {
    auto v = ArgumentParser::split_csv("a,,b,");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "b");
    EXPECT_TRUE(ArgumentParser::split_csv("").empty());
}

} // namespace plug_scan
