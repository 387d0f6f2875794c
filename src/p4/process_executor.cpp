#include <p4_mcp/p4/process_executor.hpp>

#include <p4_mcp/core/log.hpp>
#include <p4_mcp/core/subprocess.hpp>

namespace p4_mcp {

namespace {

// Strip trailing newlines/whitespace from p4 diagnostics.
std::string TrimRight(std::string s) {
    while (!s.empty() &&
           (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

} // anonymous namespace

ProcessExecutor::ProcessExecutor(std::string program,
                                 std::chrono::milliseconds timeout)
    : program_(std::move(program)), timeout_(timeout) {}

Result<std::string, ExecutionError> ProcessExecutor::Execute(const P4Command& command) {
    using R = Result<std::string, ExecutionError>;

    auto invocation = ToInvocation(command, program_);
    LogDebug("p4", "exec: " + FormatInvocation(invocation));

    auto run = RunSubprocess(invocation.program, invocation.args, timeout_);
    if (run.IsErr()) {
        LogError("p4", "spawn failed: " + run.Error());
        ExecutionError error;
        error.kind = ExecutionErrorKind::SpawnFailed;
        error.message = "Failed to run p4: " + run.Error();
        return R::Err(std::move(error));
    }

    auto outcome = std::move(run).Value();
    if (outcome.timed_out) {
        LogWarn("p4", std::string(CommandName(command)) + " timed out after " +
                          std::to_string(timeout_.count()) + " ms");
        ExecutionError error;
        error.kind = ExecutionErrorKind::TimedOut;
        error.message = "p4 " + std::string(CommandName(command)) +
                        " timed out after " + std::to_string(timeout_.count()) + " ms";
        error.stderr_text = TrimRight(std::move(outcome.stderr_text));
        return R::Err(std::move(error));
    }

    if (outcome.exit_code != 0) {
        auto stderr_text = TrimRight(std::move(outcome.stderr_text));
        LogInfo("p4", std::string(CommandName(command)) + " exited with status " +
                          std::to_string(outcome.exit_code));
        ExecutionError error;
        error.kind = ExecutionErrorKind::ToolFailed;
        error.message = "p4 command failed: " + stderr_text;
        error.stderr_text = std::move(stderr_text);
        error.exit_code = outcome.exit_code;
        return R::Err(std::move(error));
    }

    LogDebug("p4", std::string(CommandName(command)) + " returned " +
                       std::to_string(outcome.stdout_text.size()) + " bytes");
    return R::Ok(std::move(outcome.stdout_text));
}

} // namespace p4_mcp
