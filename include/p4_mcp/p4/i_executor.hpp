#pragma once

#include <p4_mcp/core/result.hpp>
#include <p4_mcp/p4/command.hpp>

#include <optional>
#include <string>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// ExecutionError: why a P4 command did not produce output.
// ---------------------------------------------------------------------------
enum class ExecutionErrorKind {
    SpawnFailed,  // binary missing, not executable, pipe/fork failure
    ToolFailed,   // p4 ran and exited non-zero
    TimedOut,     // p4 ran longer than the configured timeout and was killed
};

struct ExecutionError {
    ExecutionErrorKind kind = ExecutionErrorKind::ToolFailed;
    std::string message;
    std::string stderr_text;
    std::optional<int> exit_code;

    [[nodiscard]] std::string KindName() const {
        switch (kind) {
            case ExecutionErrorKind::SpawnFailed: return "spawn_failed";
            case ExecutionErrorKind::ToolFailed:  return "tool_failed";
            case ExecutionErrorKind::TimedOut:    return "timed_out";
        }
        return "tool_failed";
    }

    bool operator==(const ExecutionError& other) const {
        return kind == other.kind && message == other.message &&
               stderr_text == other.stderr_text && exit_code == other.exit_code;
    }
};

// ---------------------------------------------------------------------------
// IP4Executor: runs one P4 command and returns its text output.
//
// The server binds exactly one implementation for its lifetime: the real
// ProcessExecutor or the canned-text MockExecutor. Execute() reports every
// failure through the Result, never by throwing.
// ---------------------------------------------------------------------------
class IP4Executor {
public:
    virtual ~IP4Executor() = default;

    IP4Executor(const IP4Executor&) = delete;
    IP4Executor& operator=(const IP4Executor&) = delete;
    IP4Executor(IP4Executor&&) = delete;
    IP4Executor& operator=(IP4Executor&&) = delete;

    [[nodiscard]] virtual Result<std::string, ExecutionError> Execute(
        const P4Command& command) = 0;

    // Short backend name for log lines ("mock", "p4").
    [[nodiscard]] virtual std::string Name() const = 0;

protected:
    IP4Executor() = default;
};

} // namespace p4_mcp
