#pragma once

#include <p4_mcp/mcp/dispatcher.hpp>

#include <cstddef>
#include <iostream>

namespace p4_mcp {

struct ServerStats {
    size_t lines_read = 0;      // non-blank lines
    size_t requests = 0;        // decoded and queued
    size_t dropped = 0;         // malformed frames
    size_t notifications = 0;   // notifications/* frames, never answered
    size_t responses = 0;       // frames written
};

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over line-delimited JSON streams.
//
// A reader thread pulls lines from `in`, decodes them and queues requests in
// arrival order. Run() dispatches them one at a time on the calling thread
// and writes each response line to `out` before taking the next request.
// Malformed frames are logged and dropped, never answered.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(Dispatcher& dispatcher,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Blocks until EOF (or a stream error) on `in` and all queued requests
    // have been answered.
    ServerStats Run();

private:
    Dispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace p4_mcp
