/*───────────────────────────────────────────────────────────
 *  logging.hpp  –  leveled stderr logging
 *───────────────────────────────────────────────────────────*/
#pragma once

#include "qrouter/common/common.hpp"

namespace qrouter {

enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

/* process-wide threshold; messages below it are dropped */
void     SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

/* "debug" | "info" | "warn" | "error" | "off" (case-insensitive) */
bool     ParseLogLevel(const string& text, LogLevel& out);

void logD(const string& msg);
void logI(const string& msg);
void logW(const string& msg);
void logE(const string& msg);

} // namespace qrouter
