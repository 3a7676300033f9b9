#pragma once

#include <string>
#include <vector>

namespace fmutex {

// Exit status reported when a command could not be executed
constexpr int command_not_executable = 127;

// Run a command, searching PATH for command[0], and wait for it to exit.
//
// Returns the exit code of the command, 128 + signal number if it was
// terminated by a signal, or command_not_executable if it could not be
// started. Throws std::invalid_argument if command is empty and io_error if
// the process cannot be created or waited for.
int run_command(const std::vector<std::string>& command);

}  // namespace fmutex
