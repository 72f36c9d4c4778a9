#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/timestamp.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <utility>

namespace ftc_mcp {

namespace {

constexpr size_t kShortSessionLength = 8;

struct LevelStyle {
    const char* tag;     // fixed width, 5 chars
    const char* color;
};

LevelStyle StyleOf(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"DEBUG", "\033[90m"};
        case LogLevel::Info:  return {"INFO ", "\033[36m"};
        case LogLevel::Warn:  return {"WARN ", "\033[33m"};
        case LogLevel::Error: return {"ERROR", "\033[1;31m"};
    }
    return {"     ", ""};
}

constexpr const char* kDim = "\033[90m";
constexpr const char* kReset = "\033[0m";

std::string WallClock() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::array<char, 16> buf{};
    const auto n = std::strftime(buf.data(), buf.size(), "%H:%M:%S", &local);
    return std::string(buf.data(), n);
}

thread_local std::string t_log_session;

class DiscardSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::shared_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_shared<Logger>(std::make_unique<DiscardSink>(),
                                                LogLevel::Error);
    return slot;
}

std::mutex& GlobalSlotMutex() {
    static std::mutex m;
    return m;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogFormat> ParseLogFormat(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "color" || lower == "text") {
        return LogFormat::Color;
    }
    if (lower == "json") {
        return LogFormat::Json;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// TextSink
// ---------------------------------------------------------------------------
TextSink::TextSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void TextSink::Write(const LogRecord& record) {
    const auto style = StyleOf(record.level);
    const auto session = record.session_id.substr(0, kShortSessionLength);

    if (!use_color_) {
        out_ << Iso8601Now() << " [" << LogLevelName(record.level) << "] ["
             << record.component << "] ";
        if (!session.empty()) {
            out_ << '(' << session << ") ";
        }
        out_ << record.message << '\n';
        return;
    }

    out_ << kDim << WallClock() << kReset << ' '
         << style.color << style.tag << kReset << ' '
         << kDim << '[' << record.component << ']';
    if (!session.empty()) {
        out_ << " (" << session << ')';
    }
    out_ << kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << style.color << record.message << kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line;
    line["ts"] = Iso8601Now();
    line["level"] = LogLevelName(record.level);
    line["component"] = std::string(record.component);
    if (!record.session_id.empty()) {
        line["session"] = std::string(record.session_id);
    }
    line["message"] = std::string(record.message);
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

std::unique_ptr<ILogSink> MakeLogSink(LogFormat format, bool use_color) {
    if (format == LogFormat::Json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<TextSink>(use_color, std::cerr);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    const LogRecord record{level, component, message, t_log_session};
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(record);
}

// ---------------------------------------------------------------------------
// ScopedLogSession
// ---------------------------------------------------------------------------
ScopedLogSession::ScopedLogSession(std::string session_id)
    : previous_(std::exchange(t_log_session, std::move(session_id))) {}

ScopedLogSession::~ScopedLogSession() {
    t_log_session = std::move(previous_);
}

const std::string& CurrentLogSession() {
    return t_log_session;
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    auto logger = std::make_shared<Logger>(std::move(sink), min_level);
    std::lock_guard<std::mutex> lock(GlobalSlotMutex());
    GlobalSlot() = std::move(logger);
}

namespace {

void LogGlobal(LogLevel level, std::string_view component, std::string_view message) {
    std::shared_ptr<Logger> logger;
    {
        std::lock_guard<std::mutex> lock(GlobalSlotMutex());
        logger = GlobalSlot();
    }
    logger->Log(level, component, message);
}

} // anonymous namespace

void LogDebug(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    LogGlobal(LogLevel::Error, component, message);
}

} // namespace ftc_mcp
