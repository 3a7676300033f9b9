#include "process.hpp"
#include "exception.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fmutex {

int run_command(const std::vector<std::string>& command) {
  if (command.empty()) {
    throw std::invalid_argument("missing command");
  }

  // Prepare argv before forking
  std::vector<char*> argv;
  for (const auto& arg : command) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // Built before forking, the child only calls write() and strerror()
  std::string exec_error = "error: failed to execute " + command[0] + ": ";

  pid_t pid = ::fork();
  if (pid == -1) {
    throw io_error("failed to start command: " + command[0], std::error_code(errno, std::system_category()));
  }

  if (pid == 0) {
    ::execvp(argv[0], argv.data());
    const char* reason = std::strerror(errno);
    ssize_t ignored = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
    ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    _exit(command_not_executable);
  }

  log(log_level::debug) << "started " << command[0] << " with pid " << pid << std::endl;

  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid(pid, &status, 0);
  } while (ret == -1 && errno == EINTR);

  if (ret == -1) {
    throw io_error("failed to wait for command: " + command[0], std::error_code(errno, std::system_category()));
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return EXIT_FAILURE;
}

}  // namespace fmutex
