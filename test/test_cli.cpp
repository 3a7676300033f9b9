#include "cli.hpp"
#include "event.hpp"
#include "lock_file.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
#ifdef _WIN32
    test_dir = fs::temp_directory_path() / ("fmutex_cli_test_" + name);
#else
    test_dir = fs::temp_directory_path() / ("fmutex_cli_test_" + name + "_" + std::to_string(::getpid()));
#endif
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
    lock_path = test_dir / "x.lock";
  }

  void TearDown() override {
    fmutex::set_events_enabled(false);
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  // Run the command line and capture what it writes to stderr
  int Run(std::vector<std::string> args) {
    args.insert(args.begin(), "fmutex");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    testing::internal::CaptureStderr();
    int status = fmutex::cli_main(static_cast<int>(argv.size()), argv.data());
    err = testing::internal::GetCapturedStderr();
    return status;
  }

  fs::path test_dir;
  fs::path lock_path;
  std::string err;
};

TEST_F(CliTest, Usage) {
  EXPECT_EQ(Run({}), EXIT_FAILURE);
  EXPECT_NE(err.find("fmutex [options] <lockfile>"), std::string::npos);

  EXPECT_EQ(Run({"--help"}), EXIT_FAILURE);
  EXPECT_NE(err.find("--nonblock"), std::string::npos);
}

TEST_F(CliTest, Version) {
  testing::internal::CaptureStdout();
  int status = Run({"--version"});
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(status, EXIT_SUCCESS);
  EXPECT_EQ(out.rfind("fmutex ", 0), 0u);
}

TEST_F(CliTest, LockWithoutCommand) {
  EXPECT_EQ(Run({lock_path.string()}), EXIT_SUCCESS);
  EXPECT_TRUE(fs::exists(lock_path));
  EXPECT_EQ(err, "");

  // Released before returning
  EXPECT_TRUE(fmutex::try_lock(lock_path).has_value());
}

TEST_F(CliTest, MissingLockFile) {
  EXPECT_EQ(Run({"--nonblock"}), EXIT_FAILURE);
  EXPECT_EQ(err, "error: missing lock file argument\n");
}

TEST_F(CliTest, UnknownOption) {
  EXPECT_EQ(Run({"--bogus", lock_path.string()}), EXIT_FAILURE);
  EXPECT_EQ(err, "error: unknown option: --bogus\n");
}

TEST_F(CliTest, ConflictExitCodeRange) {
  EXPECT_EQ(Run({"-E", "256", lock_path.string()}), EXIT_FAILURE);
  EXPECT_EQ(err, "error: invalid conflict exit code: 256\n");

  EXPECT_EQ(Run({"-E", "-1", lock_path.string()}), EXIT_FAILURE);
  EXPECT_EQ(err, "error: invalid conflict exit code: -1\n");

  EXPECT_EQ(Run({"-E", "x", lock_path.string()}), EXIT_FAILURE);
  EXPECT_EQ(err.rfind("error: ", 0), 0u);

  EXPECT_EQ(Run({"-E", "0", lock_path.string()}), EXIT_SUCCESS);
  EXPECT_EQ(Run({"-E", "255", lock_path.string()}), EXIT_SUCCESS);
}

TEST_F(CliTest, OpenFailure) {
  fs::path missing = test_dir / "missing" / "x.lock";

  EXPECT_EQ(Run({missing.string()}), EXIT_FAILURE);
  EXPECT_EQ(err.rfind("error: failed to open lock file: ", 0), 0u);
  EXPECT_FALSE(fs::exists(missing.parent_path()));
}

TEST_F(CliTest, NonblockConflict) {
  std::optional<fmutex::guard> held = fmutex::try_lock(lock_path);
  ASSERT_TRUE(held.has_value());

  EXPECT_EQ(Run({"--nonblock", lock_path.string()}), 1);
  EXPECT_EQ(Run({"-n", "-E", "9", lock_path.string()}), 9);
  EXPECT_EQ(Run({"-n", "--conflict-exit-code=0", lock_path.string()}), 0);

  held->unlock();
  EXPECT_EQ(Run({"-n", "-E", "9", lock_path.string()}), EXIT_SUCCESS);
}

#ifndef _WIN32

TEST_F(CliTest, ExitStatusPassedThrough) {
  EXPECT_EQ(Run({lock_path.string(), "true"}), 0);
  EXPECT_EQ(Run({lock_path.string(), "sh", "-c", "exit 7"}), 7);
  EXPECT_EQ(Run({"-n", lock_path.string(), "sh", "-c", "exit 42"}), 42);
}

TEST_F(CliTest, CommandArgumentsNotParsed) {
  fs::path marker = test_dir / "marker";

  // Options after the command belong to the command
  EXPECT_EQ(Run({lock_path.string(), "sh", "-c", "echo \"$1\" > \"$2\"", "sh", "-n", marker.string()}), 0);
  EXPECT_TRUE(fs::exists(marker));
}

TEST_F(CliTest, CommandRunsUnderLock) {
  // The command sees the lock held
  std::string check = "test -e " + lock_path.string();
  EXPECT_EQ(Run({lock_path.string(), "sh", "-c", check}), 0);

  EXPECT_EQ(Run({lock_path.string(), "sh", "-c", "exit 0"}), 0);
  EXPECT_TRUE(fmutex::try_lock(lock_path).has_value());
}

TEST_F(CliTest, CommandNotExecutable) {
  EXPECT_EQ(Run({lock_path.string(), "fmutex-test-no-such-command"}), 127);
  EXPECT_EQ(err, "error: failed to execute fmutex-test-no-such-command: No such file or directory\n");

  // Released after the failed command
  EXPECT_TRUE(fmutex::try_lock(lock_path).has_value());
}

TEST_F(CliTest, JsonEvents) {
  EXPECT_EQ(Run({"--json", lock_path.string(), "sh", "-c", "exit 3"}), 3);

  std::string path = fmutex::escape(lock_path.string());
  std::string expected;
  expected += "{ \"type\": \"waiting\", \"path\": \"" + path + "\" }\n";
  expected += "{ \"type\": \"acquired\", \"path\": \"" + path + "\" }\n";
  expected += "{ \"type\": \"exited\", \"path\": \"" + path + "\", \"value\": 3 }\n";
  expected += "{ \"type\": \"released\", \"path\": \"" + path + "\" }\n";
  EXPECT_EQ(err, expected);
}

TEST_F(CliTest, JsonContended) {
  std::optional<fmutex::guard> held = fmutex::try_lock(lock_path);
  ASSERT_TRUE(held.has_value());

  EXPECT_EQ(Run({"-J", "-n", lock_path.string()}), 1);
  EXPECT_EQ(err, "{ \"type\": \"contended\", \"path\": \"" + fmutex::escape(lock_path.string()) + "\" }\n");
}

#endif
