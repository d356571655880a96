#include <gtest/gtest.h>
#include "torrentflow/core/config.hpp"
#include <fstream>
#include <filesystem>

using namespace torrentflow::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_torrentflow_config.txt";
    }

    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("session.download_dir", "/tmp/downloads");

    auto value = config.get("session.download_dir");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "/tmp/downloads");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto value = Config::instance().get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedIntegerFallsBack) {
    auto& config = Config::instance();

    config.set("session.tick_interval_ms", "fast");
    config.set("session.subscriber_queue", "8 slots");

    EXPECT_EQ(config.get_int("session.tick_interval_ms", 1000), 1000);
    EXPECT_EQ(config.get_int("session.subscriber_queue", 8), 8);
    EXPECT_FALSE(config.get_as<int>("session.tick_interval_ms").has_value());
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, SessionDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_int("session.tick_interval_ms"), 1000);
    EXPECT_EQ(config.get_int("session.metadata_timeout_s"), 60);
    EXPECT_EQ(config.get_int("session.subscriber_queue"), 8);
    EXPECT_EQ(config.get_int("seed.piece_size"), 262144);
    EXPECT_EQ(config.get_string("ipc.socket_path"), "/tmp/torrentflow.sock");
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_FALSE(config.get_string("session.download_dir").empty());
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "session.download_dir=/srv/torrents\n";
    file << "session.tick_interval_ms = 250 \n";
    file << "not a key value line\n";
    file << "log.level=debug\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("session.download_dir"), "/srv/torrents");
    EXPECT_EQ(config.get_int("session.tick_interval_ms"), 250);
    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_FALSE(config.get("not a key value line").has_value());
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("seed.announce", "udp://tracker.example:6969/announce");
    config.set("session.subscriber_queue", "16");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("seed.announce"), "udp://tracker.example:6969/announce");
    EXPECT_EQ(new_config.get_int("session.subscriber_queue"), 16);
}
