#pragma once

#include <p4_mcp/mcp/protocol.hpp>
#include <p4_mcp/mcp/tool_registry.hpp>
#include <p4_mcp/p4/i_executor.hpp>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// Dispatcher: turns one decoded Request into exactly one Response.
//
// Holds no session state: tools/list, tools/call and ping are served before
// initialize. Every failure (unknown tool, rejected arguments, backend error,
// stray exception) comes back as an Error response; Dispatch() never throws.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, IP4Executor& executor);

    [[nodiscard]] Response Dispatch(const Request& request);

private:
    Response HandleInitialize(const Request& request);
    Response HandleToolsList(const Request& request);
    Response HandleToolsCall(const Request& request);

    const ToolRegistry& registry_;
    IP4Executor& executor_;
};

} // namespace p4_mcp
