#pragma once

#include <p4_mcp/config/app_config.hpp>
#include <p4_mcp/p4/i_executor.hpp>

#include <memory>

namespace p4_mcp {

// Select the backend once from configuration: MockExecutor when mock_mode is
// set, otherwise a ProcessExecutor for config.p4_binary.
[[nodiscard]] std::unique_ptr<IP4Executor> CreateExecutor(const AppConfig& config);

// Run `p4 info` once. Returns its output, or a Backend-category Error
// naming the failure kind.
[[nodiscard]] Result<std::string, Error> CheckBackend(IP4Executor& executor);

} // namespace p4_mcp
