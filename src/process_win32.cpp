#include "process.hpp"
#include "exception.hpp"
#include "log.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

#include <Windows.h>

namespace fmutex {

// Quote an argument for the Windows command line
static std::string quote(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
    return arg;
  }

  std::string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      backslashes++;
      continue;
    }
    if (c == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
    }
    else {
      quoted.append(backslashes, '\\');
    }
    backslashes = 0;
    quoted += c;
  }
  quoted.append(backslashes * 2, '\\');
  quoted += '"';
  return quoted;
}

int run_command(const std::vector<std::string>& command) {
  if (command.empty()) {
    throw std::invalid_argument("missing command");
  }

  std::string cmdline;
  for (const auto& arg : command) {
    if (!cmdline.empty()) cmdline += ' ';
    cmdline += quote(arg);
  }

  STARTUPINFOA si = {};
  si.cb = sizeof(si);
  PROCESS_INFORMATION pi = {};

  if (!CreateProcessA(NULL, cmdline.data(), NULL, NULL, TRUE, 0, NULL, NULL, &si, &pi)) {
    DWORD error = GetLastError();
    if (error == ERROR_FILE_NOT_FOUND || error == ERROR_PATH_NOT_FOUND) {
      std::cerr << "error: failed to execute " << command[0] << ": "
                << std::error_code(error, std::system_category()).message() << std::endl;
      return command_not_executable;
    }
    throw io_error("failed to start command: " + command[0], std::error_code(error, std::system_category()));
  }

  log(log_level::debug) << "started " << command[0] << " with pid " << pi.dwProcessId << std::endl;

  CloseHandle(pi.hThread);

  DWORD code = 0;
  if (WaitForSingleObject(pi.hProcess, INFINITE) == WAIT_FAILED || !GetExitCodeProcess(pi.hProcess, &code)) {
    DWORD error = GetLastError();
    CloseHandle(pi.hProcess);
    throw io_error("failed to wait for command: " + command[0], std::error_code(error, std::system_category()));
  }

  CloseHandle(pi.hProcess);
  return static_cast<int>(code);
}

}  // namespace fmutex
