#include "cli.hpp"
#include "argparser.hpp"
#include "event.hpp"
#include "exception.hpp"
#include "lock_file.hpp"
#include "log.hpp"
#include "process.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fmutex {

static int usage() {
  std::cerr << "fmutex [options] <lockfile> [<command> [<args>...]]" << std::endl;
  std::cerr << std::endl;
  std::cerr << "Run a command while holding an exclusive lock on <lockfile>." << std::endl;
  std::cerr << std::endl;
  std::cerr << "  -n, --nonblock                 fail instead of waiting if the lock is held" << std::endl;
  std::cerr << "  -E, --conflict-exit-code <int> exit code if the lock is held (default 1)" << std::endl;
  std::cerr << "  -l, --log-level <level>        debug, info, warn, error or off (default off)" << std::endl;
  std::cerr << "  -J, --json                     emit JSON events on stderr" << std::endl;
  std::cerr << "  -h, --help                     show this help" << std::endl;
  std::cerr << "  -V, --version                  show version" << std::endl;
  return EXIT_FAILURE;
}

static int version() {
  std::cout << "fmutex " << FMUTEX_VERSION << std::endl;
  return EXIT_SUCCESS;
}

static std::string tolower(std::string s) {
  // Convert string to lowercase
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

static int error(const std::string& msg) {
  std::cerr << "error: " << tolower(msg) << std::endl;
  return EXIT_FAILURE;
}

static int cmd_fmutex(const argparser& args) {
  if (args.size() < 1) throw std::invalid_argument("missing lock file argument");

  std::filesystem::path lockfile = args.get_value_path(0);
  std::vector<std::string> command = args.values_from(1);

  int conflict_exit_code = args.get_option_int("--conflict-exit-code");
  if (conflict_exit_code < 0 || conflict_exit_code > 255)
    throw std::invalid_argument("invalid conflict exit code: " + args.get_option("--conflict-exit-code"));

  std::optional<guard> held;

  if (args.has_option("--nonblock")) {
    held = try_lock(lockfile);
    if (!held) {
      event("contended", lockfile.string());
      log(log_level::info) << "lock is held elsewhere: " << lockfile.string() << std::endl;
      return conflict_exit_code;
    }
  }
  else {
    event("waiting", lockfile.string());
    held = lock(lockfile);
  }

  event("acquired", lockfile.string());

  int status = EXIT_SUCCESS;
  if (!command.empty()) {
    status = run_command(command);
    event("exited", lockfile.string(), static_cast<long long>(status));
  }

  // Release explicitly so that a failure is reported
  held->unlock();
  event("released", lockfile.string());

  return status;
}

int cli_main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      return usage();
    }

    argparser args;
    args.set_env_prefix("FMUTEX");
    args.set_stop_at_value(1);
    args.add_bool_option("--nonblock");
    args.add_option_alias("--nonblock", "-n");
    args.add_option("--conflict-exit-code", "1");
    args.add_option_alias("--conflict-exit-code", "-E");
    args.add_option("--log-level", "off");
    args.add_option_alias("--log-level", "-l");
    args.add_bool_option("--json");
    args.add_option_alias("--json", "-J");
    args.add_bool_option("--help");
    args.add_option_alias("--help", "-h");
    args.add_bool_option("--version");
    args.add_option_alias("--version", "-V");
    args.parse(argc, argv);

    if (args.has_option("--help")) return usage();
    if (args.has_option("--version")) return version();
    if (args.has_option("--json")) set_events_enabled();

    set_log_level(parse_log_level(args.get_option("--log-level")));

    return cmd_fmutex(args);
  }
  catch (const io_error& e) {
    event("error", "", e.what());
    return error(e.what());
  }
  catch (const std::exception& e) {
    return error(e.what());
  }
}

}  // namespace fmutex
