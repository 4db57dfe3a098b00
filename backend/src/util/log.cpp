#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace
{
    std::mutex g_log_mutex;
    std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
    std::ostream* g_sink = nullptr; // guarded by g_log_mutex
}

LogLevel parse_log_level(std::string_view s)
{
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn")  return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level '" + std::string(s) +
                                "'. Valid options are 'debug', 'info', 'warn', 'error'.");
}

const char* to_cstr(LogLevel lvl)
{
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }

void set_log_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lk(g_log_mutex);
    g_sink = sink;
}

void log_line(LogLevel lvl, std::string_view tag, std::string_view msg)
{
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::ostream& os = g_sink ? *g_sink
                     : (lvl >= LogLevel::Warn ? std::cerr : std::cout);
    os << "[" << tag << "] " << msg << '\n';
    if (lvl >= LogLevel::Warn) os.flush();
}
