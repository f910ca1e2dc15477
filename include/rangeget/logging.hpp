#pragma once

#include <string>

namespace rangeget {

inline const std::string kLoggerName = "rangeget";

// Installs the colored stderr logger as the spdlog default. The base level is
// warn, SPDLOG_LEVEL overrides it, and verbosity 1 or 2 raises it to debug or
// trace. Safe to call more than once.
void setupLogging(int verbosity);

} // namespace rangeget
