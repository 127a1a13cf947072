#include <vendcore/sources/keyboard_source.hpp>
#include <vendcore/sources/script_source.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

using namespace vendcore;
using namespace vendcore::sources;

TEST(KeyboardSourceTest, CoinKeysUseConfiguredValues) {
    KeyMap keys;
    keys.quarter = 250;

    auto request = KeyboardSource::request_for_key('q', keys);

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ((*request)["command"], "insert_coin");
    EXPECT_EQ((*request)["amount"], 250);
    EXPECT_EQ((*KeyboardSource::request_for_key('O', keys))["amount"], 100);
}

TEST(KeyboardSourceTest, DigitsSelectConfiguredButtons) {
    KeyMap keys;
    keys.buttons = {"cola", "chips"};

    auto request = KeyboardSource::request_for_key('2', keys);

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ((*request)["command"], "select_product");
    EXPECT_EQ((*request)["product"], "chips");
    EXPECT_FALSE(KeyboardSource::request_for_key('3', keys).has_value());
}

TEST(KeyboardSourceTest, ControlKeys) {
    KeyMap keys;

    EXPECT_EQ((*KeyboardSource::request_for_key('v', keys))["command"], "dispense");
    EXPECT_EQ((*KeyboardSource::request_for_key('c', keys))["command"], "refund");
    EXPECT_EQ((*KeyboardSource::request_for_key('r', keys))["command"], "restock");
    EXPECT_EQ((*KeyboardSource::request_for_key('m', keys))["command"], "enter_maintenance");
    EXPECT_EQ((*KeyboardSource::request_for_key('s', keys))["command"], "shutdown");
    EXPECT_FALSE(KeyboardSource::request_for_key('z', keys).has_value());
}

class ScriptSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::warn);
        path = testing::TempDir() + "vendcore_script_test.jsonl";
        std::remove(path.c_str());
        source = std::make_unique<ScriptSource>("Script", path, std::chrono::milliseconds(10));
        source->subscribe([this](const json& request) { received.push_back(request); });
    }

    void TearDown() override {
        source.reset();
        std::remove(path.c_str());
    }

    void append(const std::string& text) {
        std::ofstream file(path, std::ios::app);
        file << text;
    }

    std::string path;
    std::unique_ptr<ScriptSource> source;
    std::vector<json> received;
};

TEST_F(ScriptSourceTest, MissingFileEmitsNothing) {
    EXPECT_EQ(source->read_new_lines(), 0u);
    EXPECT_TRUE(received.empty());
}

TEST_F(ScriptSourceTest, EmitsEachCompleteLineOnce) {
    append("{\"command\": \"insert_coin\", \"amount\": 100}\n# comment\n\n{\"command\": \"refund\"}\n");

    EXPECT_EQ(source->read_new_lines(), 2u);
    EXPECT_EQ(source->read_new_lines(), 0u);

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0]["amount"], 100);
    EXPECT_EQ(received[1]["command"], "refund");
}

TEST_F(ScriptSourceTest, PartialLineWaitsForNewline) {
    append("{\"command\": \"dispense\"");
    EXPECT_EQ(source->read_new_lines(), 0u);

    append("}\n");
    EXPECT_EQ(source->read_new_lines(), 1u);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0]["command"], "dispense");
}

TEST_F(ScriptSourceTest, UnparsableLinesAreSkipped) {
    append("not json\n{\"command\": \"status\"}\n");

    EXPECT_EQ(source->read_new_lines(), 1u);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0]["command"], "status");
}

TEST_F(ScriptSourceTest, ConnectedSourceFollowsTheFile) {
    std::atomic<int> seen{0};
    source->subscribe([&seen](const json&) { ++seen; });
    source->connect();
    EXPECT_EQ(source->state(), CommandSource::State::Connected);

    append("{\"command\": \"status\"}\n");
    for (int i = 0; i < 200 && seen.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    source->disconnect();
    EXPECT_EQ(seen.load(), 1);
    EXPECT_FALSE(source->is_connected());
    EXPECT_EQ(source->state(), CommandSource::State::Disconnected);
}
