#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace p4_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// Lowercase name of a level, inverse of ParseLogLevel.
const char* LogLevelName(LogLevel level);

// Abstract log sink: implementations decide where/how to write.
// stdout carries protocol frames, so every sink defaults to stderr.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Plain human-readable lines.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Colored, compact output. When use_color is false, falls back to the same
// format as ConsoleSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// Machine-readable JSON lines.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink. The stdin reader thread and
// the dispatch thread both log through the same instance.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Call once from main before the server starts.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace p4_mcp
