#pragma once

#include <p4_mcp/mcp/tool_registry.hpp>

namespace p4_mcp {

struct P4ToolOptions {
    // false: missing or wrong-typed required arguments fall back to empty
    // values and the command still runs. true: such calls are rejected with
    // a ValidationError naming the field.
    bool strict_arguments = false;
};

// Register the eight Perforce tools (p4_status, p4_sync, p4_edit, p4_add,
// p4_submit, p4_revert, p4_opened, p4_changes) with their input schemas and
// argument decoders.
void RegisterP4Tools(ToolRegistry& registry, const P4ToolOptions& options = {});

} // namespace p4_mcp
