#include "qrouter/common/logging.hpp"
#include "qrouter/common/string_util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace qrouter {

static std::atomic<uint8_t> g_log_level{static_cast<uint8_t>(LogLevel::INFO)};
static std::mutex           g_log_lock;

void SetLogLevel(LogLevel level) {
    g_log_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool ParseLogLevel(const string& text, LogLevel& out) {
    string l = StringUtil::Lower(StringUtil::Trim(text));
    if      (l == "debug")                   out = LogLevel::DEBUG;
    else if (l == "info")                    out = LogLevel::INFO;
    else if (l == "warn" || l == "warning")  out = LogLevel::WARN;
    else if (l == "error")                   out = LogLevel::ERROR;
    else if (l == "off" || l == "none")      out = LogLevel::OFF;
    else return false;
    return true;
}

static void emit(LogLevel level, const char* tag, const string& s) {
    if (level < GetLogLevel()) return;
    std::lock_guard<std::mutex> guard(g_log_lock);
    std::cerr << tag << s << '\n';
}

void logD(const string& s){ emit(LogLevel::DEBUG, "[DEBUG] ", s); }
void logI(const string& s){ emit(LogLevel::INFO,  "[INFO]  ", s); }
void logW(const string& s){ emit(LogLevel::WARN,  "[WARN]  ", s); }
void logE(const string& s){ emit(LogLevel::ERROR, "[ERR]   ", s); }

} // namespace qrouter
