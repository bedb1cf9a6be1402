#pragma once
#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

inline constexpr std::size_t LOG_FUNC_COL_WIDTH = 18;
inline constexpr char FILLER = '.';

enum class LogLevel : int { debug = 0, info = 1, warning = 2, error = 3, quiet = 4 };

inline std::atomic<int> LOG_THRESHOLD{static_cast<int>(LogLevel::info)};

inline bool log_enabled(LogLevel lv) {
    return static_cast<int>(lv) >= LOG_THRESHOLD.load(std::memory_order_relaxed);
}

inline void set_log_level(LogLevel lv) {
    LOG_THRESHOLD.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_debug(bool on) {
    set_log_level(on ? LogLevel::debug : LogLevel::info);
}

// "debug" / "info" / "warning" / "error" / "quiet"; false on unknown names
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if      (s == "debug")                  out = LogLevel::debug;
    else if (s == "info")                   out = LogLevel::info;
    else if (s == "warning" || s == "warn") out = LogLevel::warning;
    else if (s == "error")                  out = LogLevel::error;
    else if (s == "quiet")                  out = LogLevel::quiet;
    else return false;
    return true;
}

// local time: "MM-DD HH:MM:SS"
inline std::string getTime() {
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

inline std::string pad_func_name(const char* func, std::size_t width = LOG_FUNC_COL_WIDTH, char filler = FILLER) {
    std::string s(func ? func : "");
    if (s.size() < width) {
        s.append(width - s.size(), filler);
    } else if (s.size() > width) {
        s.resize(width);
    }
    return s;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

// One log statement. Text is collected locally and written to stderr in one
// piece when the temporary dies, so lines from worker threads never interleave.
class LogLine {
public:
    LogLine(bool on, std::string prefix) : on_(on) {
        if (on_) buf_ << prefix;
    }
    ~LogLine() {
        if (!on_) return;
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << buf_.str();
        std::cerr.flush();
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<class T>
    LogLine& operator<<(const T& v) {
        if (on_) buf_ << v;
        return *this;
    }
    LogLine& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (on_) manip(buf_);
        return *this;
    }

private:
    bool on_;
    std::ostringstream buf_;
};

inline std::string log_prefix(char tag, const char* func) {
    return std::string("[") + tag + "::" + getTime() + "::" + pad_func_name(func) + "] ";
}

inline std::string debug_prefix(const char* file, int line, const char* func) {
    return std::string("[D::") + file + ":" + std::to_string(line) + " " + pad_func_name(func) + "] ";
}

// Format: [L::MM-DD HH:MM:SS::<func>] <message>
#define log_stream()     LogLine(log_enabled(LogLevel::info),    log_enabled(LogLevel::info)    ? log_prefix('I', __func__) : std::string())
#define warning_stream() LogLine(log_enabled(LogLevel::warning), log_enabled(LogLevel::warning) ? log_prefix('W', __func__) : std::string())
#define error_stream()   LogLine(log_enabled(LogLevel::error),   log_enabled(LogLevel::error)   ? log_prefix('E', __func__) : std::string())

// Format: [D::<FILE>:<LINE> <func>] <message>
#define debug_stream()   LogLine(log_enabled(LogLevel::debug),   log_enabled(LogLevel::debug)   ? debug_prefix(__FILE__, __LINE__, __func__) : std::string())
