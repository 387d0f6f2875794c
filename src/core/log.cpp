#include <p4_mcp/core/log.hpp>
#include <p4_mcp/core/ansi.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace p4_mcp {

namespace {

const char* LevelTagUpper(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string HhMmSsNow() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time_t_now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// Fixed-width 5-char level tag.
const char* LevelTagPadded(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Iso8601Now()
        << " [" << LevelTagUpper(level) << "] "
        << "[" << component << "] "
        << message << '\n';
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(out_, level, component, message);
    out_.flush();
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        out_.flush();
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTagPadded(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    out_ << "{\"ts\":\"" << Iso8601Now()
         << "\",\"level\":\"" << LevelTagUpper(level)
         << "\",\"component\":\"";
    JsonEscape(out_, component);
    out_ << "\",\"message\":\"";
    JsonEscape(out_, message);
    out_ << "\"}\n";
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// NullSink: discards all messages (used before InitGlobalLogger is called).
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace p4_mcp
