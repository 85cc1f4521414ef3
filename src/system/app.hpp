#ifndef APP_HPP
#define APP_HPP

#include <ostream>

// Runs the whole tool: help and version go to out, diagnostics to err.
// Returns the process exit code (0 success, 1 runtime error, 2 usage error).
int run_spicat(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

#endif
