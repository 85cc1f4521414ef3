#include "log.hpp"

bool g_verbose = false;
