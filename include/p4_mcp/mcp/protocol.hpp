#pragma once

#include <p4_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// MCP 2024-11-05 wire model.
//
// One JSON object per line. Requests carry "method", "id" and (for
// initialize and tools/call) "params". Responses echo the request id
// verbatim; the id is a JSON string or integer, and keeps its JSON type.
// ---------------------------------------------------------------------------

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "p4-mcp";

constexpr const char* kMethodInitialize = "initialize";
constexpr const char* kMethodToolsList = "tools/list";
constexpr const char* kMethodToolsCall = "tools/call";
constexpr const char* kMethodPing = "ping";

// JSON-RPC error codes.
constexpr int kErrorInvalidParams = -32602;
constexpr int kErrorInternal = -32603;

// -- Requests ---------------------------------------------------------------

enum class RequestKind {
    Initialize,
    ListTools,
    CallTool,
    Ping,
};

struct InitializeParams {
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    std::string client_name;
    std::string client_version;

    bool operator==(const InitializeParams& other) const {
        return protocol_version == other.protocol_version &&
               capabilities == other.capabilities &&
               client_name == other.client_name &&
               client_version == other.client_version;
    }
};

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const CallToolParams& other) const {
        return name == other.name && arguments == other.arguments;
    }
};

struct Request {
    RequestKind kind = RequestKind::Ping;
    nlohmann::json id;
    std::optional<InitializeParams> initialize;  // set iff kind == Initialize
    std::optional<CallToolParams> call;          // set iff kind == CallTool

    static Request MakeInitialize(nlohmann::json id, InitializeParams params);
    static Request MakeListTools(nlohmann::json id);
    static Request MakeCallTool(nlohmann::json id, CallToolParams params);
    static Request MakePing(nlohmann::json id);

    bool operator==(const Request& other) const {
        return kind == other.kind && id == other.id &&
               initialize == other.initialize && call == other.call;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }
};

// -- Responses --------------------------------------------------------------

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

struct ContentBlock {
    enum class Type { Text, Image };

    Type type = Type::Text;
    std::string text;       // Text
    std::string data;       // Image: base64 payload
    std::string mime_type;  // Image

    static ContentBlock Text(std::string text);
    static ContentBlock Image(std::string data, std::string mime_type);
};

struct ErrorObject {
    int code = kErrorInternal;
    std::string message;
    std::optional<nlohmann::json> data;
};

enum class ResponseKind {
    InitializeResult,
    ToolsList,
    ToolResult,
    Pong,
    Error,
};

struct Response {
    ResponseKind kind = ResponseKind::Pong;
    nlohmann::json id;

    // InitializeResult
    std::string protocol_version;
    std::string server_name;
    std::string server_version;

    std::vector<ToolDescriptor> tools;   // ToolsList
    std::vector<ContentBlock> content;   // ToolResult
    ErrorObject error;                   // Error

    static Response MakeInitializeResult(nlohmann::json id,
                                         std::string server_version);
    static Response MakeToolsList(nlohmann::json id,
                                  std::vector<ToolDescriptor> tools);
    static Response MakeToolResult(nlohmann::json id,
                                   std::vector<ContentBlock> content);
    static Response MakePong(nlohmann::json id);
    static Response MakeError(nlohmann::json id, int code, std::string message,
                              std::optional<nlohmann::json> data = std::nullopt);
};

// -- Frame codec ------------------------------------------------------------

struct DecodeError {
    enum class Kind {
        Malformed,     // not JSON, or not a valid request object
        Notification,  // a notifications/* message: needs no reply
    };

    Kind kind = Kind::Malformed;
    std::string message;
};

// True if `id` is an acceptable correlation id (string or integer).
[[nodiscard]] bool IsValidRequestId(const nlohmann::json& id);

[[nodiscard]] Result<Request, DecodeError> DecodeRequest(const nlohmann::json& frame);
[[nodiscard]] Result<Request, DecodeError> DecodeLine(std::string_view line);

[[nodiscard]] nlohmann::json EncodeRequest(const Request& request);
[[nodiscard]] nlohmann::json EncodeResponse(const Response& response);

// Serialize one response frame (no trailing newline). Invalid UTF-8 in tool
// output is replaced rather than rejected.
[[nodiscard]] std::string SerializeResponse(const Response& response);

} // namespace p4_mcp
