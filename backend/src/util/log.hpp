#pragma once
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" | "info" | "warn" | "error". Throws std::invalid_argument otherwise.
LogLevel parse_log_level(std::string_view s);
const char* to_cstr(LogLevel lvl);

void set_log_level(LogLevel lvl);
LogLevel log_level();

// Redirect every level to one stream (tests). nullptr restores stdout/stderr.
void set_log_sink(std::ostream* sink);

// Writes "[tag] msg" as a single line. Debug/Info -> stdout, Warn/Error -> stderr.
void log_line(LogLevel lvl, std::string_view tag, std::string_view msg);

// Streams a message and emits it on destruction:
//   LogStream(LogLevel::Info, "dispatch") << "queued " << n << " jobs";
class LogStream {
public:
    LogStream(LogLevel lvl, std::string_view tag) : lvl_(lvl), tag_(tag) {}
    ~LogStream() {
        if (lvl_ >= log_level()) log_line(lvl_, tag_, os_.str());
    }
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& v) {
        os_ << v;
        return *this;
    }

private:
    LogLevel lvl_;
    std::string tag_;
    std::ostringstream os_;
};

inline LogStream log_debug(std::string_view tag) { return LogStream(LogLevel::Debug, tag); }
inline LogStream log_info(std::string_view tag)  { return LogStream(LogLevel::Info, tag); }
inline LogStream log_warn(std::string_view tag)  { return LogStream(LogLevel::Warn, tag); }
inline LogStream log_error(std::string_view tag) { return LogStream(LogLevel::Error, tag); }
