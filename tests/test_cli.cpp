#include <gtest/gtest.h>

#include "core/cli.hpp"
#include "supervisor/lock.hpp"
#include "supervisor/registry.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>

// ── Subcommand dispatch tests ───────────────────────────────

TEST(CLIDispatch, NoArgs_ReturnsError) {
    char* argv[] = { (char*)"botctl" };
    EXPECT_EQ(CLI::run(1, argv), 1);
}

TEST(CLIDispatch, Help_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpFlag_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"--help" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, HelpShort_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"-h" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, Version_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"version" };
    testing::internal::CaptureStdout();
    int ret = CLI::run(2, argv);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out.rfind("botctl ", 0), 0u);
}

TEST(CLIDispatch, VersionFlag_ReturnsZero) {
    char* argv[] = { (char*)"botctl", (char*)"--version" };
    EXPECT_EQ(CLI::run(2, argv), 0);
}

TEST(CLIDispatch, UnknownCommand_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"foobar" };
    EXPECT_EQ(CLI::run(2, argv), 1);
}

TEST(CLIDispatch, StartBadModifier_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"start", (char*)"later" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

TEST(CLIDispatch, StatusExtraArg_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"status", (char*)"random" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

TEST(CLIDispatch, ConfigWithoutPath_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"status", (char*)"--config" };
    EXPECT_EQ(CLI::run(3, argv), 1);
}

TEST(CLIDispatch, MissingConfigFile_ReturnsError) {
    char* argv[] = { (char*)"botctl", (char*)"--config", (char*)"/nonexistent/botctl.yaml", (char*)"status" };
    EXPECT_EQ(CLI::run(4, argv), 1);
}

// ── Option parsing ──────────────────────────────────────────

TEST(CLIOptions, GlobalFlagsAnywhere) {
    char* argv[] = { (char*)"botctl", (char*)"-v", (char*)"logs", (char*)"--config=/tmp/b.yaml",
                     (char*)"self", (char*)"20" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_options(6, argv, opts));
    EXPECT_TRUE(opts.verbose);
    EXPECT_EQ(opts.config_path, "/tmp/b.yaml");
    EXPECT_EQ(opts.args, (std::vector<std::string>{"logs", "self", "20"}));
}

TEST(CLIOptions, ShortConfigFlag) {
    char* argv[] = { (char*)"botctl", (char*)"-c", (char*)"bots.yaml", (char*)"start" };
    CLI::Options opts;
    ASSERT_TRUE(CLI::parse_options(4, argv, opts));
    EXPECT_FALSE(opts.verbose);
    EXPECT_EQ(opts.config_path, "bots.yaml");
    EXPECT_EQ(opts.args, std::vector<std::string>{"start"});
}

TEST(CLIOptions, EmptyConfigValueRejected) {
    char* argv[] = { (char*)"botctl", (char*)"--config=", (char*)"start" };
    CLI::Options opts;
    EXPECT_FALSE(CLI::parse_options(3, argv, opts));
}

// ── Helpers ─────────────────────────────────────────────────

TEST(CLIHelpers, TitleCase) {
    EXPECT_EQ(CLI::title_case("self-bot"), "Self-Bot");
    EXPECT_EQ(CLI::title_case("normal_bot"), "Normal_Bot");
    EXPECT_EQ(CLI::title_case("manager"), "Manager");
    EXPECT_EQ(CLI::title_case(""), "");
}

class CLIEnvTest : public BotEnvTest {
protected:
    std::string original_home_;
    bool had_home_ = false;

    void SetUp() override {
        BotEnvTest::SetUp();
        const char* home = std::getenv("BOTCTL_HOME");
        if (home) {
            had_home_ = true;
            original_home_ = home;
        }
        setenv("BOTCTL_HOME", root_.c_str(), 1);
    }

    void TearDown() override {
        if (had_home_) {
            setenv("BOTCTL_HOME", original_home_.c_str(), 1);
        } else {
            unsetenv("BOTCTL_HOME");
        }
        BotEnvTest::TearDown();
    }

    void install(const Config& config) {
        ASSERT_TRUE(config.save(Config::config_path()));
    }

    int run(std::vector<std::string> words) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>("botctl"));
        for (auto& w : words) argv.push_back(w.data());
        return CLI::run(static_cast<int>(argv.size()), argv.data());
    }

    void write_lines(const std::string& path, int count) {
        fs::create_directories(fs::path(path).parent_path());
        std::ofstream f(path);
        for (int i = 1; i <= count; ++i) f << "line " << i << "\n";
    }
};

TEST_F(CLIEnvTest, TailFile) {
    std::string path = (root_ / "tail.log").string();
    write_lines(path, 10);

    std::vector<std::string> out;
    ASSERT_TRUE(CLI::tail_file(path, 3, out));
    EXPECT_EQ(out, (std::vector<std::string>{"line 8", "line 9", "line 10"}));

    ASSERT_TRUE(CLI::tail_file(path, 50, out));
    EXPECT_EQ(out.size(), 10u);

    EXPECT_FALSE(CLI::tail_file((root_ / "missing.log").string(), 3, out));
    EXPECT_TRUE(out.empty());
}

TEST_F(CLIEnvTest, Lifecycle) {
    Config config = default_pair();
    install(config);

    EXPECT_EQ(run({"start"}), 0);
    EXPECT_TRUE(fs::exists(config.pid_file_path()));
    EXPECT_FALSE(fs::exists(config.lock_dir_path()));

    EXPECT_EQ(run({"start"}), 1);  // already running

    EXPECT_EQ(run({"status"}), 0);
    EXPECT_TRUE(fs::exists(config.pid_file_path()));

    EXPECT_EQ(run({"stop"}), 0);
    EXPECT_FALSE(fs::exists(config.pid_file_path()));
    EXPECT_TRUE(ProcessManager::find_by_command(tag_).empty());

    EXPECT_EQ(run({"stop"}), 0);
    EXPECT_EQ(run({"status"}), 0);

    std::string manager_log = read_file(config.manager_log_path());
    EXPECT_NE(manager_log.find("=== Starting bots ==="), std::string::npos);
    EXPECT_NE(manager_log.find("started successfully with PID"), std::string::npos);
    EXPECT_NE(manager_log.find("No PID file found"), std::string::npos);
}

TEST_F(CLIEnvTest, RestartReturnsZero) {
    install(default_pair());
    EXPECT_EQ(run({"restart"}), 0);
    EXPECT_EQ(run({"stop"}), 0);
}

TEST_F(CLIEnvTest, PartialStartReturnsZero) {
    install(make_config({make_bot("self-bot", "self", kLoopBody, false), make_bot("normal-bot", "normal")}));
    EXPECT_EQ(run({"start"}), 0);
}

TEST_F(CLIEnvTest, TotalFailureReturnsError) {
    Config config = make_config({
        make_bot("self-bot", "self", kLoopBody, false),
        make_bot("normal-bot", "normal", kLoopBody, false),
    });
    install(config);
    EXPECT_EQ(run({"start"}), 1);
    EXPECT_FALSE(fs::exists(config.pid_file_path()));
}

TEST_F(CLIEnvTest, BusyLockReturnsError) {
    Config config = default_pair();
    install(config);

    SupervisorLock holder(config.lock_dir_path(), 500, 50);
    ASSERT_EQ(holder.acquire(), SupervisorLock::Status::Acquired);

    EXPECT_EQ(run({"status"}), 1);
    EXPECT_EQ(run({"start"}), 1);
    EXPECT_FALSE(fs::exists(config.pid_file_path()));
    EXPECT_TRUE(holder.held());
}

TEST_F(CLIEnvTest, StaleLockIsReclaimed) {
    Config config = default_pair();
    install(config);
    fs::create_directories(config.lock_dir_path());
    std::ofstream(config.lock_dir_path() + "/pid") << dead_pid() << "\n";

    EXPECT_EQ(run({"status"}), 0);
    EXPECT_FALSE(fs::exists(config.lock_dir_path()));
}

TEST_F(CLIEnvTest, InvalidConfigReturnsError) {
    std::ofstream(Config::config_path()) << "bots: [unclosed\n";
    EXPECT_EQ(run({"status"}), 1);
    EXPECT_EQ(run({"logs"}), 1);
}

TEST_F(CLIEnvTest, ExplicitConfigResolvesRelativePaths) {
    fs::create_directories(root_ / "conf");
    {
        std::ofstream f(root_ / "conf" / "bots.yaml");
        f << "paths:\n  state_dir: state\n  log_dir: logs\n"
             "bots:\n  - name: worker\n    command: [/bin/true]\n";
    }
    fs::create_directories(root_ / "conf" / "logs");
    std::ofstream(root_ / "conf" / "logs" / "worker.log") << "worker says hi\n";

    testing::internal::CaptureStdout();
    int ret = run({"--config", (root_ / "conf" / "bots.yaml").string(), "logs", "worker"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out, "worker says hi\n");
}

TEST_F(CLIEnvTest, HelpShowsLogDirOfSelectedConfig) {
    fs::create_directories(root_ / "conf");
    {
        std::ofstream f(root_ / "conf" / "bots.yaml");
        f << "paths:\n  log_dir: custom-logs\n";
    }

    testing::internal::CaptureStdout();
    int ret = run({"help"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_NE(out.find("Log files are stored in: " + (root_ / "logs").string() + "\n"), std::string::npos);

    testing::internal::CaptureStdout();
    ret = run({"-c", (root_ / "conf" / "bots.yaml").string(), "help"});
    out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_NE(out.find("Log files are stored in: " + (root_ / "conf" / "custom-logs").string() + "\n"),
              std::string::npos);
}

// ── logs ────────────────────────────────────────────────────

TEST_F(CLIEnvTest, LogsSingleBot) {
    Config config = default_pair();
    install(config);
    write_lines(config.bot_log_path(config.data().bots[0]), 100);

    testing::internal::CaptureStdout();
    int ret = run({"logs", "self", "2"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out, "line 99\nline 100\n");

    testing::internal::CaptureStdout();
    ret = run({"logs", "self-bot"});
    out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 50);
    EXPECT_EQ(out.rfind("line 51\n", 0), 0u);
}

TEST_F(CLIEnvTest, LogsManager) {
    Config config = default_pair();
    install(config);
    write_lines(config.manager_log_path(), 5);

    testing::internal::CaptureStdout();
    int ret = run({"logs", "manager", "1"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out, "line 5\n");
}

TEST_F(CLIEnvTest, LogsAllShowsEverySection) {
    Config config = default_pair();
    install(config);
    write_lines(config.manager_log_path(), 3);
    write_lines(config.bot_log_path(config.data().bots[1]), 3);

    testing::internal::CaptureStdout();
    int ret = run({"logs"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out,
              "=== Manager Logs ===\nline 1\nline 2\nline 3\n"
              "\n=== Self-Bot Logs ===\nNo self-bot logs\n"
              "\n=== Normal-Bot Logs ===\nline 1\nline 2\nline 3\n");
}

TEST_F(CLIEnvTest, LogsMissingFileReturnsError) {
    install(default_pair());
    EXPECT_EQ(run({"logs", "normal"}), 1);
}

TEST_F(CLIEnvTest, LogsUnknownBotReturnsError) {
    install(default_pair());
    EXPECT_EQ(run({"logs", "nobody"}), 1);
}

TEST_F(CLIEnvTest, LogsBadLineCountReturnsError) {
    install(default_pair());
    EXPECT_EQ(run({"logs", "self", "0"}), 1);
    EXPECT_EQ(run({"logs", "self", "ten"}), 1);
    EXPECT_EQ(run({"logs", "self", "-3"}), 1);
}

TEST_F(CLIEnvTest, LogsDoesNotTakeLock) {
    Config config = default_pair();
    install(config);
    write_lines(config.manager_log_path(), 1);

    SupervisorLock holder(config.lock_dir_path(), 500, 50);
    ASSERT_EQ(holder.acquire(), SupervisorLock::Status::Acquired);

    testing::internal::CaptureStdout();
    int ret = run({"logs", "manager"});
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ret, 0);
    EXPECT_EQ(out, "line 1\n");
}
