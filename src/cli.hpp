#pragma once

namespace fmutex {

// Entry point of the fmutex command:
//
//   fmutex [options] <lockfile> [<command> [<args>...]]
//
// Returns the exit status of the command, the conflict exit code if the lock
// is held and --nonblock was given, or EXIT_FAILURE after printing an error.
int cli_main(int argc, char* argv[]);

}  // namespace fmutex
