#pragma once

#include <p4_mcp/p4/i_executor.hpp>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// MockExecutor: deterministic canned output for offline use and tests.
//
// The text echoes the command's parameters (paths, files, description,
// changelist, max) verbatim. No filesystem access, no subprocess, no clock:
// the same command always yields byte-identical text, and it never fails.
// ---------------------------------------------------------------------------
class MockExecutor : public IP4Executor {
public:
    MockExecutor() = default;

    [[nodiscard]] Result<std::string, ExecutionError> Execute(
        const P4Command& command) override;

    [[nodiscard]] std::string Name() const override { return "mock"; }
};

} // namespace p4_mcp
