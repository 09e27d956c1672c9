#include <gtest/gtest.h>
#include <regex>
#include <sstream>
#include "cli/cli.hpp"
#include "server/sync_server.hpp"
#include "test_utils.hpp"

using namespace histvault;

class CLITest : public ::testing::Test {
protected:
    test::TempDir dir{"histvault_cli"};
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        test::init_test_logging();
    }

    config::Settings settings_for(const std::string& host) {
        auto settings = config::Settings::defaults(dir / host);
        settings.client.hostname = host;
        return settings;
    }

    int run(const config::Settings& settings, const std::vector<std::string>& args) {
        out.str("");
        err.str("");
        cli::CLI cli(settings, out, err);
        return cli.run(args);
    }

    static std::string first_line(const std::string& text) {
        return text.substr(0, text.find('\n'));
    }
};

TEST_F(CLITest, UuidPrintsId) {
    EXPECT_EQ(run(settings_for("laptop"), {"uuid"}), 0);
    EXPECT_TRUE(std::regex_match(first_line(out.str()), std::regex("^[0-9a-f]{32}$"))) << out.str();
}

TEST_F(CLITest, UnknownCommandFails) {
    EXPECT_EQ(run(settings_for("laptop"), {"frobnicate"}), 1);
    EXPECT_NE(err.str().find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);

    EXPECT_EQ(run(settings_for("laptop"), {}), 1);
}

TEST_F(CLITest, HistoryAddAndList) {
    const auto settings = settings_for("laptop");

    ASSERT_EQ(run(settings, {"history", "add", "--cwd", "/src", "-x", "2", "--", "make", "test"}), 0);
    const auto id = first_line(out.str());
    EXPECT_EQ(id.size(), 32u);
    ASSERT_EQ(run(settings, {"history", "add", "--", "git", "status"}), 0);

    ASSERT_EQ(run(settings, {"history", "list"}), 0);
    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    ASSERT_TRUE(std::getline(lines, first));
    ASSERT_TRUE(std::getline(lines, second));
    EXPECT_NE(first.find("\t2\tlaptop\tmake test"), std::string::npos) << first;
    EXPECT_NE(second.find("\t0\tlaptop\tgit status"), std::string::npos) << second;

    ASSERT_EQ(run(settings, {"history", "list", "-n", "1"}), 0);
    EXPECT_EQ(out.str().find("make test"), std::string::npos);
    EXPECT_NE(out.str().find("git status"), std::string::npos);
}

TEST_F(CLITest, HistoryAddValidatesArguments) {
    const auto settings = settings_for("laptop");
    EXPECT_EQ(run(settings, {"history", "add"}), 1);
    EXPECT_EQ(run(settings, {"history", "add", "--exit", "abc", "--", "ls"}), 1);
    EXPECT_EQ(run(settings, {"history", "list", "--limit", "0"}), 1);
    EXPECT_NE(err.str().find("Invalid arguments"), std::string::npos);
}

TEST_F(CLITest, StatusAndLogout) {
    const auto settings = settings_for("laptop");

    ASSERT_EQ(run(settings, {"status"}), 0);
    EXPECT_NE(out.str().find("not logged in"), std::string::npos);
    EXPECT_NE(out.str().find("records:      0"), std::string::npos);

    EXPECT_EQ(run(settings, {"logout"}), 0);
    EXPECT_NE(out.str().find("Not logged in"), std::string::npos);

    EXPECT_EQ(run(settings, {"sync"}), 1);
    EXPECT_NE(err.str().find("not logged in"), std::string::npos);
}

TEST_F(CLITest, KeyIsStable) {
    const auto settings = settings_for("laptop");
    ASSERT_EQ(run(settings, {"key"}), 0);
    const auto key = first_line(out.str());
    ASSERT_EQ(run(settings, {"key"}), 0);
    EXPECT_EQ(first_line(out.str()), key);
    EXPECT_EQ(key.size(), 44u);
}

TEST_F(CLITest, LoginRequiresKey) {
    auto settings = settings_for("desktop");
    EXPECT_EQ(run(settings, {"login", "-u", "alice", "-p", "pw"}), 1);
    EXPECT_NE(err.str().find("No key found"), std::string::npos);

    EXPECT_EQ(run(settings, {"login", "-u", "alice", "-p", "pw", "-k", "bogus"}), 1);
    EXPECT_NE(err.str().find("Key error"), std::string::npos);
}

TEST_F(CLITest, RegisterLoginAndSyncBetweenHosts) {
    test::ServerStack stack;
    server::SyncServer server(stack.service, "127.0.0.1", 0, std::chrono::seconds(5));
    ASSERT_TRUE(server.start_listener());
    const std::string address = "http://127.0.0.1:" + std::to_string(server.port());

    auto laptop = settings_for("laptop");
    laptop.client.sync_address = address;
    auto desktop = settings_for("desktop");
    desktop.client.sync_address = address;

    ASSERT_EQ(run(laptop, {"register", "-u", "alice", "-e", "alice@example.com", "-p", "pw"}), 0) << err.str();
    ASSERT_EQ(run(laptop, {"history", "add", "--", "echo", "from", "laptop"}), 0);
    ASSERT_EQ(run(laptop, {"sync"}), 0) << err.str();
    EXPECT_NE(out.str().find("uploaded:   1"), std::string::npos) << out.str();

    ASSERT_EQ(run(laptop, {"key"}), 0);
    const auto key = first_line(out.str());

    ASSERT_EQ(run(desktop, {"login", "-u", "alice", "-p", "pw", "-k", key}), 0) << err.str();
    ASSERT_EQ(run(desktop, {"sync"}), 0) << err.str();
    EXPECT_NE(out.str().find("downloaded: 1"), std::string::npos) << out.str();

    ASSERT_EQ(run(desktop, {"history", "list"}), 0);
    EXPECT_NE(out.str().find("\tlaptop\techo from laptop"), std::string::npos) << out.str();

    server.shutdown();
}
