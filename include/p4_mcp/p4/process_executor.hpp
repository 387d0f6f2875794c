#pragma once

#include <p4_mcp/p4/i_executor.hpp>

#include <chrono>
#include <string>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// ProcessExecutor: runs the real p4 binary.
//
// Exit status 0 yields stdout. A non-zero exit yields ToolFailed carrying
// stderr; a binary that cannot be started yields SpawnFailed; a command that
// outlives `timeout` is killed and yields TimedOut. A zero timeout waits
// indefinitely.
// ---------------------------------------------------------------------------
class ProcessExecutor : public IP4Executor {
public:
    explicit ProcessExecutor(std::string program = kDefaultP4Binary,
                             std::chrono::milliseconds timeout = std::chrono::seconds(600));

    [[nodiscard]] Result<std::string, ExecutionError> Execute(
        const P4Command& command) override;

    [[nodiscard]] std::string Name() const override { return program_; }

private:
    std::string program_;
    std::chrono::milliseconds timeout_;
};

} // namespace p4_mcp
