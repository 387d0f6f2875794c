#include <p4_mcp/p4/executor_factory.hpp>

#include <p4_mcp/p4/mock_executor.hpp>
#include <p4_mcp/p4/process_executor.hpp>

namespace p4_mcp {

std::unique_ptr<IP4Executor> CreateExecutor(const AppConfig& config) {
    if (config.mock_mode) {
        return std::make_unique<MockExecutor>();
    }
    return std::make_unique<ProcessExecutor>(
        config.p4_binary, std::chrono::seconds(config.timeout_seconds));
}

Result<std::string, Error> CheckBackend(IP4Executor& executor) {
    auto result = executor.Execute(InfoCommand{});
    if (result.IsErr()) {
        const auto& err = result.Error();
        return Result<std::string, Error>::Err(
            Error{"Check", err.KindName() + ": " + err.message, ErrorCategory::Backend});
    }
    return Result<std::string, Error>::Ok(std::move(result).Value());
}

} // namespace p4_mcp
