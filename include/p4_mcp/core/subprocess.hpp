#pragma once

#include <p4_mcp/core/result.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// SubprocessResult: outcome of a child process that was started.
// ---------------------------------------------------------------------------
struct SubprocessResult {
    int exit_code = 0;       // 128 + signal number if killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

// ---------------------------------------------------------------------------
// RunSubprocess: run `program` (resolved through PATH) with `args` as a
// discrete argv, never through a shell. The child's stdin is /dev/null.
//
// Returns Err with a human-readable reason when the child could not be
// started (pipe/fork failure, binary missing or not executable). A child
// that started and then failed is an Ok result with a non-zero exit_code.
// A zero timeout waits indefinitely; on expiry the child is killed and
// timed_out is set.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<SubprocessResult, std::string> RunSubprocess(
    const std::string& program,
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout);

} // namespace p4_mcp
