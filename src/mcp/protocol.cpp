#include <p4_mcp/mcp/protocol.hpp>

namespace p4_mcp {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr std::string_view kNotificationPrefix = "notifications/";

Result<Request, DecodeError> Malformed(std::string message) {
    return Result<Request, DecodeError>::Err(
        DecodeError{DecodeError::Kind::Malformed, std::move(message)});
}

std::string OptStringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

Result<Request, DecodeError> DecodeInitialize(nlohmann::json id,
                                              const nlohmann::json& frame) {
    auto params_it = frame.find("params");
    if (params_it == frame.end() || !params_it->is_object()) {
        return Malformed("initialize requires a params object");
    }
    const auto& params = *params_it;

    auto version_it = params.find("protocolVersion");
    if (version_it == params.end() || !version_it->is_string()) {
        return Malformed("initialize params missing protocolVersion");
    }

    InitializeParams init;
    init.protocol_version = version_it->get<std::string>();
    auto caps_it = params.find("capabilities");
    if (caps_it != params.end() && caps_it->is_object()) {
        init.capabilities = *caps_it;
    }
    auto client_it = params.find("clientInfo");
    if (client_it != params.end() && client_it->is_object()) {
        init.client_name = OptStringField(*client_it, "name");
        init.client_version = OptStringField(*client_it, "version");
    }
    return Result<Request, DecodeError>::Ok(
        Request::MakeInitialize(std::move(id), std::move(init)));
}

Result<Request, DecodeError> DecodeCallTool(nlohmann::json id,
                                            const nlohmann::json& frame) {
    auto params_it = frame.find("params");
    if (params_it == frame.end() || !params_it->is_object()) {
        return Malformed("tools/call requires a params object");
    }
    const auto& params = *params_it;

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return Malformed("tools/call params missing tool name");
    }

    CallToolParams call;
    call.name = name_it->get<std::string>();
    // Arguments are best-effort: anything but an object is treated as empty.
    auto args_it = params.find("arguments");
    if (args_it != params.end() && args_it->is_object()) {
        call.arguments = *args_it;
    }
    return Result<Request, DecodeError>::Ok(
        Request::MakeCallTool(std::move(id), std::move(call)));
}

nlohmann::json EncodeContentBlock(const ContentBlock& block) {
    if (block.type == ContentBlock::Type::Image) {
        return {{"type", "image"},
                {"data", block.data},
                {"mimeType", block.mime_type}};
    }
    return {{"type", "text"}, {"text", block.text}};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------
Request Request::MakeInitialize(nlohmann::json id, InitializeParams params) {
    Request r;
    r.kind = RequestKind::Initialize;
    r.id = std::move(id);
    r.initialize = std::move(params);
    return r;
}

Request Request::MakeListTools(nlohmann::json id) {
    Request r;
    r.kind = RequestKind::ListTools;
    r.id = std::move(id);
    return r;
}

Request Request::MakeCallTool(nlohmann::json id, CallToolParams params) {
    Request r;
    r.kind = RequestKind::CallTool;
    r.id = std::move(id);
    r.call = std::move(params);
    return r;
}

Request Request::MakePing(nlohmann::json id) {
    Request r;
    r.kind = RequestKind::Ping;
    r.id = std::move(id);
    return r;
}

ContentBlock ContentBlock::Text(std::string text) {
    ContentBlock b;
    b.type = Type::Text;
    b.text = std::move(text);
    return b;
}

ContentBlock ContentBlock::Image(std::string data, std::string mime_type) {
    ContentBlock b;
    b.type = Type::Image;
    b.data = std::move(data);
    b.mime_type = std::move(mime_type);
    return b;
}

Response Response::MakeInitializeResult(nlohmann::json id,
                                        std::string server_version) {
    Response r;
    r.kind = ResponseKind::InitializeResult;
    r.id = std::move(id);
    r.protocol_version = kProtocolVersion;
    r.server_name = kServerName;
    r.server_version = std::move(server_version);
    return r;
}

Response Response::MakeToolsList(nlohmann::json id,
                                 std::vector<ToolDescriptor> tools) {
    Response r;
    r.kind = ResponseKind::ToolsList;
    r.id = std::move(id);
    r.tools = std::move(tools);
    return r;
}

Response Response::MakeToolResult(nlohmann::json id,
                                  std::vector<ContentBlock> content) {
    Response r;
    r.kind = ResponseKind::ToolResult;
    r.id = std::move(id);
    r.content = std::move(content);
    return r;
}

Response Response::MakePong(nlohmann::json id) {
    Response r;
    r.kind = ResponseKind::Pong;
    r.id = std::move(id);
    return r;
}

Response Response::MakeError(nlohmann::json id, int code, std::string message,
                             std::optional<nlohmann::json> data) {
    Response r;
    r.kind = ResponseKind::Error;
    r.id = std::move(id);
    r.error = ErrorObject{code, std::move(message), std::move(data)};
    return r;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
bool IsValidRequestId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer();
}

Result<Request, DecodeError> DecodeRequest(const nlohmann::json& frame) {
    if (!frame.is_object()) {
        return Malformed("frame is not a JSON object");
    }

    auto version_it = frame.find("jsonrpc");
    if (version_it != frame.end() && *version_it != kJsonRpcVersion) {
        return Malformed("unsupported jsonrpc version");
    }

    auto method_it = frame.find("method");
    if (method_it == frame.end() || !method_it->is_string()) {
        return Malformed("frame has no method");
    }
    const auto method = method_it->get<std::string>();

    auto id_it = frame.find("id");
    if (id_it == frame.end()) {
        if (method.compare(0, kNotificationPrefix.size(), kNotificationPrefix) == 0) {
            return Result<Request, DecodeError>::Err(
                DecodeError{DecodeError::Kind::Notification, method});
        }
        return Malformed("request '" + method + "' has no id");
    }
    if (!IsValidRequestId(*id_it)) {
        return Malformed("request id must be a string or an integer");
    }
    nlohmann::json id = *id_it;

    if (method == kMethodInitialize) {
        return DecodeInitialize(std::move(id), frame);
    }
    if (method == kMethodToolsList) {
        return Result<Request, DecodeError>::Ok(Request::MakeListTools(std::move(id)));
    }
    if (method == kMethodToolsCall) {
        return DecodeCallTool(std::move(id), frame);
    }
    if (method == kMethodPing) {
        return Result<Request, DecodeError>::Ok(Request::MakePing(std::move(id)));
    }
    return Malformed("unknown method: " + method);
}

Result<Request, DecodeError> DecodeLine(std::string_view line) {
    auto frame = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (frame.is_discarded()) {
        return Malformed("invalid JSON");
    }
    return DecodeRequest(frame);
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json EncodeRequest(const Request& request) {
    nlohmann::json frame = {{"jsonrpc", kJsonRpcVersion}, {"id", request.id}};
    switch (request.kind) {
        case RequestKind::Initialize: {
            frame["method"] = kMethodInitialize;
            const auto init = request.initialize.value_or(InitializeParams{});
            frame["params"] = {
                {"protocolVersion", init.protocol_version},
                {"capabilities", init.capabilities},
                {"clientInfo", {{"name", init.client_name},
                                {"version", init.client_version}}}};
            break;
        }
        case RequestKind::ListTools:
            frame["method"] = kMethodToolsList;
            break;
        case RequestKind::CallTool: {
            frame["method"] = kMethodToolsCall;
            const auto call = request.call.value_or(CallToolParams{});
            frame["params"] = {{"name", call.name}, {"arguments", call.arguments}};
            break;
        }
        case RequestKind::Ping:
            frame["method"] = kMethodPing;
            break;
    }
    return frame;
}

nlohmann::json EncodeResponse(const Response& response) {
    nlohmann::json frame = {{"jsonrpc", kJsonRpcVersion}, {"id", response.id}};
    switch (response.kind) {
        case ResponseKind::InitializeResult:
            frame["result"] = {
                {"protocolVersion", response.protocol_version},
                {"capabilities", {{"tools", {{"listChanged", false}}}}},
                {"serverInfo", {{"name", response.server_name},
                                {"version", response.server_version}}}};
            break;
        case ResponseKind::ToolsList: {
            nlohmann::json tools = nlohmann::json::array();
            for (const auto& tool : response.tools) {
                tools.push_back({{"name", tool.name},
                                 {"description", tool.description},
                                 {"inputSchema", tool.input_schema}});
            }
            frame["result"] = {{"tools", std::move(tools)}};
            break;
        }
        case ResponseKind::ToolResult: {
            nlohmann::json content = nlohmann::json::array();
            for (const auto& block : response.content) {
                content.push_back(EncodeContentBlock(block));
            }
            frame["result"] = {{"content", std::move(content)}};
            break;
        }
        case ResponseKind::Pong:
            // Bare acknowledgement: the echoed id and nothing else.
            break;
        case ResponseKind::Error: {
            nlohmann::json error = {{"code", response.error.code},
                                    {"message", response.error.message}};
            if (response.error.data) {
                error["data"] = *response.error.data;
            }
            frame["error"] = std::move(error);
            break;
        }
    }
    return frame;
}

std::string SerializeResponse(const Response& response) {
    return EncodeResponse(response).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace p4_mcp
