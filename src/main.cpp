#include <p4_mcp/config/config_loader.hpp>
#include <p4_mcp/core/log.hpp>
#include <p4_mcp/core/terminal.hpp>
#include <p4_mcp/core/version.hpp>
#include <p4_mcp/mcp/dispatcher.hpp>
#include <p4_mcp/mcp/mcp_server.hpp>
#include <p4_mcp/mcp/p4_tools.hpp>
#include <p4_mcp/p4/executor_factory.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

constexpr const char* kComponent = "main";

std::unique_ptr<p4_mcp::ILogSink> MakeSink(const p4_mcp::AppConfig& config,
                                          const p4_mcp::CliOptions& cli) {
    using namespace p4_mcp;
    if (config.log_format == LogFormat::Json) {
        return std::make_unique<JsonSink>();
    }
    return std::make_unique<ColorConsoleSink>(
        ResolveLogColor(cli.force_color, cli.force_no_color));
}

// --check: run `p4 info` once through the configured backend.
int RunCheck(p4_mcp::IP4Executor& executor) {
    using namespace p4_mcp;
    auto result = CheckBackend(executor);
    if (result.IsErr()) {
        const auto& err = result.Error();
        std::cerr << "p4-mcp: " << err.CategoryName() << " check failed: "
                  << err.message << "\n";
        return err.ExitCode();
    }
    std::cout << result.Value();
    if (!result.Value().empty() && result.Value().back() != '\n') {
        std::cout << "\n";
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace p4_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "p4-mcp: " << cli.Error().message << "\n";
        return cli.Error().ExitCode();
    }

    auto config = ResolveConfig(cli.Value());
    if (config.IsErr()) {
        std::cerr << "p4-mcp: " << config.Error().message << "\n";
        return config.Error().ExitCode();
    }
    const AppConfig& cfg = config.Value();

    InitGlobalLogger(MakeSink(cfg, cli.Value()), cfg.log_level);

    auto executor = CreateExecutor(cfg);
    if (cli.Value().check) {
        return RunCheck(*executor);
    }

    ToolRegistry registry;
    RegisterP4Tools(registry, P4ToolOptions{cfg.strict_arguments});

    LogInfo(kComponent, std::string("p4-mcp ") + kVersion + " starting (backend: " +
                            executor->Name() + ", " +
                            std::to_string(registry.Tools().size()) + " tools)");

    Dispatcher dispatcher(registry, *executor);
    McpServer server(dispatcher);
    auto stats = server.Run();

    LogInfo(kComponent, "shutdown: " + std::to_string(stats.responses) +
                            " responses, " + std::to_string(stats.dropped) +
                            " malformed frames dropped, " +
                            std::to_string(stats.notifications) +
                            " notifications");
    return kExitSuccess;
}
