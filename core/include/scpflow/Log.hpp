// Minimal logging utility (header-only) for the scpflow core.
// Lines go to an injectable sink; without one they go to stderr when
// SCPFLOW_LOG is set.
#pragma once
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace scpflow {

enum class LogLevel { Debug, Info, Warning, Error };

inline const char *logLevelName(LogLevel l) {
    switch (l) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

using LogSink = std::function<void(LogLevel, const std::string&)>;

namespace detail {

struct LogState {
    std::mutex mtx;
    std::shared_ptr<LogSink> sink;
};

inline LogState& logState() {
    static LogState state;
    return state;
}

inline std::shared_ptr<LogSink> currentSink() {
    auto& st = logState();
    std::lock_guard<std::mutex> lk(st.mtx);
    return st.sink;
}

} // namespace detail

// Installs the process-wide sink. An empty function restores the default.
inline void setLogSink(LogSink sink) {
    auto& st = detail::logState();
    std::lock_guard<std::mutex> lk(st.mtx);
    if (sink)
        st.sink = std::make_shared<LogSink>(std::move(sink));
    else
        st.sink.reset();
}

inline bool logEnabled() {
    if (detail::currentSink())
        return true;
    const char *v = std::getenv("SCPFLOW_LOG");
    return v && *v && *v != '0';
}

inline void logf(LogLevel level, const char *fmt, ...) {
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    if (auto sink = detail::currentSink()) {
        (*sink)(level, std::string(buf));
        return;
    }
    std::fprintf(stderr, "[scpflow][%s] %s\n", logLevelName(level), buf);
}

} // namespace scpflow

#define SCPFLOW_LOG_AT(lvl, fmt, ...) \
    do { \
        if (scpflow::logEnabled()) \
            scpflow::logf(lvl, fmt, ##__VA_ARGS__); \
    } while (0)

#define SCPFLOW_LOGD(fmt, ...) \
    SCPFLOW_LOG_AT(scpflow::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define SCPFLOW_LOGI(fmt, ...) \
    SCPFLOW_LOG_AT(scpflow::LogLevel::Info, fmt, ##__VA_ARGS__)
#define SCPFLOW_LOGW(fmt, ...) \
    SCPFLOW_LOG_AT(scpflow::LogLevel::Warning, fmt, ##__VA_ARGS__)
#define SCPFLOW_LOGE(fmt, ...) \
    SCPFLOW_LOG_AT(scpflow::LogLevel::Error, fmt, ##__VA_ARGS__)
