#pragma once

#include <p4_mcp/core/result.hpp>
#include <p4_mcp/mcp/protocol.hpp>
#include <p4_mcp/p4/command.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// ValidationError: a tool's arguments could not be turned into a command.
// ---------------------------------------------------------------------------
struct ValidationError {
    std::string tool;
    std::string field;  // empty when not tied to one argument
    std::string message;
};

// Turns a tools/call argument object into a typed command.
using ArgumentDecoder =
    std::function<Result<P4Command, ValidationError>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: the catalog of tools and their argument decoders.
//
// Populated once at startup, read-only afterward. Tools() preserves
// registration order. HasTool() is the single authority on which tool names
// are valid.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ArgumentDecoder decoder);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] Result<P4Command, ValidationError> Decode(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ArgumentDecoder> decoders_;
};

} // namespace p4_mcp
