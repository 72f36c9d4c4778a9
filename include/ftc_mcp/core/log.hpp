#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ftc_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

enum class LogFormat {
    Color,  // human-readable, ANSI colored when enabled
    Json,   // one JSON object per line
};

/// Parse "color" / "text" / "json" (case-insensitive).
std::optional<LogFormat> ParseLogFormat(std::string_view text);

[[nodiscard]] const char* LogLevelName(LogLevel level);

// ---------------------------------------------------------------------------
// LogRecord — one log line as handed to a sink. Views are valid only for the
// duration of ILogSink::Write.
//
// `session_id` is the MCP session the emitting thread is serving, empty when
// the line is not tied to a session (startup, routing before lookup, ...).
// ---------------------------------------------------------------------------
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view component;
    std::string_view message;
    std::string_view session_id;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines:
//   color:  HH:MM:SS LEVEL [component] (session) message
//   plain:  <iso8601> [LEVEL] [component] (session) message
// Only the first 8 characters of the session id are printed.
class TextSink : public ILogSink {
public:
    explicit TextSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// {"ts","level","component","session"?,"message"} per line.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

/// Sink selected by configuration. Both write to stderr; stdout carries only
/// the startup banner and --version.
std::unique_ptr<ILogSink> MakeLogSink(LogFormat format, bool use_color);

// Serialises writes to one sink and drops records below the minimum level.
class Logger {
public:
    Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

    [[nodiscard]] bool Enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /// Tags the record with the calling thread's current log session.
    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// ScopedLogSession — tags every line the current thread logs with a session
// id until the scope ends. Scopes nest; the previous id is restored.
// ---------------------------------------------------------------------------
class ScopedLogSession {
public:
    explicit ScopedLogSession(std::string session_id);
    ~ScopedLogSession();

    ScopedLogSession(const ScopedLogSession&) = delete;
    ScopedLogSession& operator=(const ScopedLogSession&) = delete;

private:
    std::string previous_;
};

/// Session id of the innermost ScopedLogSession on this thread ("" if none).
[[nodiscard]] const std::string& CurrentLogSession();

// ---------------------------------------------------------------------------
// Global logger. Until InitGlobalLogger is called everything is discarded.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace ftc_mcp
