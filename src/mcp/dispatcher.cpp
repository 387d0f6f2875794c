#include <p4_mcp/mcp/dispatcher.hpp>

#include <p4_mcp/core/log.hpp>
#include <p4_mcp/core/version.hpp>

#include <exception>
#include <string>

namespace p4_mcp {

namespace {

constexpr const char* kComponent = "dispatcher";

std::string IdText(const nlohmann::json& id) {
    return id.dump();
}

nlohmann::json ExecutionErrorData(const ExecutionError& error) {
    nlohmann::json data = {{"kind", error.KindName()},
                           {"stderr", error.stderr_text}};
    if (error.exit_code) {
        data["exitCode"] = *error.exit_code;
    }
    return data;
}

} // anonymous namespace

Dispatcher::Dispatcher(const ToolRegistry& registry, IP4Executor& executor)
    : registry_(registry), executor_(executor) {}

Response Dispatcher::Dispatch(const Request& request) {
    try {
        switch (request.kind) {
            case RequestKind::Initialize:
                return HandleInitialize(request);
            case RequestKind::ListTools:
                return HandleToolsList(request);
            case RequestKind::CallTool:
                return HandleToolsCall(request);
            case RequestKind::Ping:
                return Response::MakePong(request.id);
        }
        return Response::MakeError(request.id, kErrorInternal,
                                   "Internal error: unhandled request kind");
    } catch (const std::exception& e) {
        LogError(kComponent, "request " + IdText(request.id) + " failed: " + e.what());
        return Response::MakeError(request.id, kErrorInternal,
                                   std::string("Internal error: ") + e.what());
    }
}

Response Dispatcher::HandleInitialize(const Request& request) {
    if (request.initialize) {
        const auto& init = *request.initialize;
        LogInfo(kComponent, "initialize from '" + init.client_name + "' " +
                                init.client_version + " (protocol " +
                                init.protocol_version + ")");
    }
    return Response::MakeInitializeResult(request.id, kVersion);
}

Response Dispatcher::HandleToolsList(const Request& request) {
    return Response::MakeToolsList(request.id, registry_.Tools());
}

Response Dispatcher::HandleToolsCall(const Request& request) {
    const CallToolParams call = request.call.value_or(CallToolParams{});

    if (!registry_.HasTool(call.name)) {
        LogWarn(kComponent, "unknown tool '" + call.name + "'");
        return Response::MakeError(request.id, kErrorInvalidParams,
                                   "Unknown tool: " + call.name);
    }

    auto decoded = registry_.Decode(call.name, call.arguments);
    if (decoded.IsErr()) {
        const auto& err = decoded.Error();
        LogWarn(kComponent, call.name + ": " + err.message);
        nlohmann::json data = {{"tool", err.tool}};
        if (!err.field.empty()) {
            data["field"] = err.field;
        }
        return Response::MakeError(request.id, kErrorInvalidParams,
                                   err.message, std::move(data));
    }
    const P4Command& command = decoded.Value();

    LogDebug(kComponent, "call " + IdText(request.id) + ": " + call.name +
                             " -> " + executor_.Name() + " " +
                             std::string(CommandName(command)));

    auto output = executor_.Execute(command);
    if (output.IsErr()) {
        const auto& err = output.Error();
        LogWarn(kComponent, call.name + " failed (" + err.KindName() + "): " +
                                err.message);
        return Response::MakeError(request.id, kErrorInternal, err.message,
                                   ExecutionErrorData(err));
    }

    return Response::MakeToolResult(request.id,
                                    {ContentBlock::Text(std::move(output).Value())});
}

} // namespace p4_mcp
