#ifndef LOG_HPP
#define LOG_HPP

#include <iostream>

// Set from --verbose. Standard output may carry the captured data, so
// "[TAG] ..." lines are written to std::cerr.
extern bool g_verbose;

#endif
