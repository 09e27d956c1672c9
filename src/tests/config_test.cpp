#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "config/settings.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::config;

class ConfigTest : public ::testing::Test {
protected:
    test::TempDir dir{"histvault_config"};

    void SetUp() override {
        test::init_test_logging();
    }

    Settings parse(const std::string& text) {
        std::istringstream input(text);
        return parse_settings(input, dir.path());
    }
};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto settings = parse("");

    EXPECT_EQ(settings.client.sync_address, "http://127.0.0.1:8888");
    EXPECT_EQ(settings.client.db_path, dir / "history.db");
    EXPECT_EQ(settings.client.key_path, dir / "key");
    EXPECT_EQ(settings.client.checkpoint_path, dir / "checkpoint.json");
    EXPECT_EQ(settings.client.page_size, 100u);
    EXPECT_EQ(settings.client.timeout, std::chrono::seconds(30));
    EXPECT_FALSE(settings.client.hostname.empty());

    EXPECT_EQ(settings.server.host, "127.0.0.1");
    EXPECT_EQ(settings.server.port, 8888);
    EXPECT_TRUE(settings.server.open_registration);
    EXPECT_EQ(settings.server.page_size, 1000u);

    EXPECT_EQ(settings.log.level, boost::log::trivial::warning);
    EXPECT_TRUE(settings.log.file.empty());
}

TEST_F(ConfigTest, OverridesFromIni) {
    const auto settings = parse(
        "[client]\n"
        "sync_address = https://sync.example.com\n"
        "hostname = work:alice\n"
        "page_size = 250\n"
        "timeout_seconds = 5\n"
        "key_path = /etc/histvault/key\n"
        "\n"
        "[server]\n"
        "host = 0.0.0.0\n"
        "port = 9000\n"
        "open_registration = false\n"
        "page_size = 500\n"
        "\n"
        "[log]\n"
        "level = debug\n"
        "file = /var/log/histvault.log\n");

    EXPECT_EQ(settings.client.sync_address, "https://sync.example.com");
    EXPECT_EQ(settings.client.hostname, "work:alice");
    EXPECT_EQ(settings.client.page_size, 250u);
    EXPECT_EQ(settings.client.timeout, std::chrono::seconds(5));
    EXPECT_EQ(settings.client.key_path, std::filesystem::path("/etc/histvault/key"));
    EXPECT_EQ(settings.client.db_path, dir / "history.db");

    EXPECT_EQ(settings.server.host, "0.0.0.0");
    EXPECT_EQ(settings.server.port, 9000);
    EXPECT_FALSE(settings.server.open_registration);
    EXPECT_EQ(settings.server.page_size, 500u);

    EXPECT_EQ(settings.log.level, boost::log::trivial::debug);
    EXPECT_EQ(settings.log.file, "/var/log/histvault.log");
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parse("[client]\npage_size = 0\n"), ConfigError);
    EXPECT_THROW(parse("[client]\npage_size = 100001\n"), ConfigError);
    EXPECT_THROW(parse("[client]\ntimeout_seconds = 0\n"), ConfigError);
    EXPECT_THROW(parse("[client]\nhostname =\n"), ConfigError);
    EXPECT_THROW(parse("[server]\nport = 70000\n"), ConfigError);
    EXPECT_THROW(parse("[server]\nport = -1\n"), ConfigError);
    EXPECT_THROW(parse("[server]\npage_size = 0\n"), ConfigError);
    EXPECT_THROW(parse("[log]\nlevel = loud\n"), ConfigError);
    EXPECT_THROW(parse("[client\n"), ConfigError);
}

TEST_F(ConfigTest, RejectsUnparsableValues) {
    EXPECT_THROW(parse("[client]\npage_size = lots\n"), ConfigError);
    EXPECT_THROW(parse("[client]\npage_size = 10x\n"), ConfigError);
    EXPECT_THROW(parse("[client]\ntimeout_seconds = 5s\n"), ConfigError);
    EXPECT_THROW(parse("[server]\nport = eighty\n"), ConfigError);
    EXPECT_THROW(parse("[server]\nopen_registration = maybe\n"), ConfigError);

    EXPECT_TRUE(parse("[server]\nopen_registration = true\n").server.open_registration);
    EXPECT_EQ(parse("[client]\npage_size = 42\n").client.page_size, 42u);
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = dir / "config.ini";
    EXPECT_EQ(load_settings(path, dir.path()).client.page_size, 100u);

    {
        std::ofstream out(path);
        out << "[client]\npage_size = 42\n";
    }
    EXPECT_EQ(load_settings(path, dir.path()).client.page_size, 42u);
}
