#include <gtest/gtest.h>

#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, NoArgs_ReturnsTUI) {
    char* argv[] = { (char*)"pisite-cpp" };
    EXPECT_EQ(CLI::run(1, argv), -1);
}

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpShort_ReturnsZero) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"-h" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, VersionFlag_ReturnsZero) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Daemon_ReturnsDaemonCode) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"daemon" };
    EXPECT_EQ(CLI::run(2, argv), -2);
}

TEST(CLIDispatch, DaemonFlag_BackwardsCompat) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"--daemon" };
    EXPECT_EQ(CLI::run(2, argv), -2);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, StartWithoutName_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"start" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, LogsWithoutName_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"logs" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, SiteNoSubcommand_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"site" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, SiteUnknown_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"site", (char*)"foobar" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

TEST(CLIDispatch, SiteAddMissingArgs_ReturnsError) {
    char* argv[] = { (char*)"pisite-cpp", (char*)"site", (char*)"add", (char*)"demo" };
    EXPECT_EQ(CLI::run(4, argv), 1);
}

TEST(CLIDispatch, HelpListsCommands) {
    testing::internal::CaptureStdout();
    char* argv[] = { (char*)"pisite-cpp", (char*)"help" };
    CLI::run(2, argv);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("status [name]"), std::string::npos);
    EXPECT_NE(output.find("logs <name>"), std::string::npos);
    EXPECT_NE(output.find("site add"), std::string::npos);
}

// ── Local mode (no daemon listening) ────────────────────────

class CLILocalTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / ("pisite-test-cli-" + std::to_string(::getpid()))).string();
        fs::create_directories(test_dir + "/site");
        setenv("PSM_CONFIG_DIR", (test_dir + "/cfg").c_str(), 1);
        setenv("PSM_PID_DIR", (test_dir + "/pids").c_str(), 1);
        // Keep captured stdout free of backend selection messages
        init_logging("off");
    }

    void TearDown() override {
        unsetenv("PSM_CONFIG_DIR");
        unsetenv("PSM_PID_DIR");
        fs::remove_all(test_dir);
    }

    int run(std::vector<std::string> args) {
        std::vector<char*> argv;
        static char prog[] = "pisite-cpp";
        argv.push_back(prog);
        for (auto& a : args) argv.push_back(&a[0]);
        return CLI::run(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(CLILocalTest, StatusWithNoSites) {
    testing::internal::CaptureStdout();
    EXPECT_EQ(run({"status"}), 0);
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("not running"), std::string::npos);
    EXPECT_NE(output.find("No sites configured"), std::string::npos);
}

TEST_F(CLILocalTest, UnknownSiteFails) {
    EXPECT_EQ(run({"start", "ghost"}), 1);
    EXPECT_EQ(run({"status", "ghost"}), 1);
    EXPECT_EQ(run({"logs", "ghost"}), 1);
}

TEST_F(CLILocalTest, SiteAddListRemove) {
    std::string cwd = test_dir + "/site";
    EXPECT_EQ(run({"site", "add", "demo", cwd, "sleep 30", "--port", "8080", "--autorestart"}), 0);

    Config cfg;
    ASSERT_TRUE(cfg.load());
    ASSERT_EQ(cfg.data().sites.size(), 1u);
    EXPECT_EQ(cfg.data().sites[0].name, "demo");
    EXPECT_EQ(cfg.data().sites[0].port, 8080);
    EXPECT_TRUE(cfg.data().sites[0].autorestart);
    EXPECT_FALSE(cfg.data().sites[0].autostart);

    testing::internal::CaptureStdout();
    EXPECT_EQ(run({"site", "list"}), 0);
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("demo"), std::string::npos);

    // Duplicate names are rejected
    EXPECT_EQ(run({"site", "add", "demo", cwd, "true"}), 1);

    EXPECT_EQ(run({"site", "rm", "demo"}), 0);
    ASSERT_TRUE(cfg.load());
    EXPECT_TRUE(cfg.data().sites.empty());
}

TEST_F(CLILocalTest, SiteAddRejectsBadPort) {
    EXPECT_EQ(run({"site", "add", "demo", test_dir + "/site", "true", "--port", "abc"}), 1);
}

TEST_F(CLILocalTest, LogsPrintsTail) {
    std::string cwd = test_dir + "/site";
    ASSERT_EQ(run({"site", "add", "demo", cwd, "true"}), 0);
    {
        FILE* f = fopen((cwd + "/activity.log").c_str(), "w");
        ASSERT_NE(f, nullptr);
        fputs("one\ntwo\nthree\n", f);
        fclose(f);
    }

    testing::internal::CaptureStdout();
    EXPECT_EQ(run({"logs", "demo", "-n", "2"}), 0);
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(output, "two\nthree\n");
}
