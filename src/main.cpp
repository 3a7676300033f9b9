#include "cli.hpp"

int main(int argc, char* argv[]) { return fmutex::cli_main(argc, argv); }
