#include <p4_mcp/mcp/p4_tools.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace p4_mcp {

namespace {

using DecodeResult = Result<P4Command, ValidationError>;

// ---------------------------------------------------------------------------
// Argument accessors. Each reads one key with best-effort coercion and
// returns nullopt when the value is absent or unusable.
// ---------------------------------------------------------------------------

std::optional<std::string> OptString(const nlohmann::json& args,
                                     const std::string& key) {
    auto it = args.find(key);
    if (it != args.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Accepts true/false, or the strings "true"/"false"/"1"/"0".
std::optional<bool> OptBool(const nlohmann::json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end()) return std::nullopt;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s == "true" || s == "1") return true;
        if (s == "false" || s == "0") return false;
    }
    return std::nullopt;
}

// Accepts a non-negative integer that fits in 32 bits, or its decimal string.
std::optional<uint32_t> OptCount(const nlohmann::json& args,
                                 const std::string& key) {
    auto it = args.find(key);
    if (it == args.end()) return std::nullopt;

    constexpr auto kMax = std::numeric_limits<uint32_t>::max();
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v <= kMax) return static_cast<uint32_t>(v);
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        if (v >= 0 && static_cast<uint64_t>(v) <= kMax) return static_cast<uint32_t>(v);
        return std::nullopt;
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty() || s.size() > 10) return std::nullopt;
        uint64_t v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + static_cast<uint64_t>(c - '0');
        }
        if (v <= kMax) return static_cast<uint32_t>(v);
    }
    return std::nullopt;
}

// Accepts an array (non-string elements are skipped) or a single string.
std::optional<std::vector<std::string>> OptStringList(const nlohmann::json& args,
                                                      const std::string& key) {
    auto it = args.find(key);
    if (it == args.end()) return std::nullopt;
    if (it->is_string()) {
        return std::vector<std::string>{it->get<std::string>()};
    }
    if (!it->is_array()) return std::nullopt;

    std::vector<std::string> out;
    for (const auto& v : *it) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        }
    }
    return out;
}

ValidationError MissingParam(const std::string& tool, const std::string& key) {
    return ValidationError{tool, key, "Missing required parameter: " + key};
}

// Required string: defaulted to "" when permissive, rejected when strict.
std::optional<std::string> RequireString(const nlohmann::json& args,
                                         const std::string& key,
                                         bool strict) {
    auto value = OptString(args, key);
    if (value && !value->empty()) return value;
    if (strict) return std::nullopt;
    return value.value_or("");
}

// Required list: defaulted to {} when permissive, rejected when strict.
std::optional<std::vector<std::string>> RequireStringList(const nlohmann::json& args,
                                                          const std::string& key,
                                                          bool strict) {
    auto value = OptStringList(args, key);
    if (value) return value;
    if (strict) return std::nullopt;
    return std::vector<std::string>{};
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, int default_value) {
    return {{"type", "integer"},
            {"description", desc},
            {"minimum", 0},
            {"default", default_value}};
}

nlohmann::json StringListProp(const std::string& desc) {
    return {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array()) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// Shared decoder for the three "verb files..." tools.
template <typename Command>
ArgumentDecoder FileListDecoder(const std::string& tool, bool strict) {
    return [tool, strict](const nlohmann::json& args) -> DecodeResult {
        auto files = RequireStringList(args, "files", strict);
        if (!files) return DecodeResult::Err(MissingParam(tool, "files"));
        Command command;
        command.files = std::move(*files);
        return DecodeResult::Ok(std::move(command));
    };
}

} // anonymous namespace

void RegisterP4Tools(ToolRegistry& registry, const P4ToolOptions& options) {
    const bool strict = options.strict_arguments;

    registry.Register(
        "p4_status",
        "Get Perforce workspace status",
        MakeSchema({{"path", StringProp("Optional path to check status for")}}),
        [](const nlohmann::json& args) -> DecodeResult {
            StatusCommand command;
            command.path = OptString(args, "path");
            return DecodeResult::Ok(std::move(command));
        });

    registry.Register(
        "p4_sync",
        "Sync files from Perforce depot",
        MakeSchema({{"path", StringProp("Path to sync (e.g., //depot/main/...)")},
                    {"force", BoolProp("Force sync (overwrite local changes)")}}),
        [](const nlohmann::json& args) -> DecodeResult {
            SyncCommand command;
            command.path = OptString(args, "path").value_or(kDefaultSyncPath);
            command.force = OptBool(args, "force").value_or(false);
            return DecodeResult::Ok(std::move(command));
        });

    registry.Register(
        "p4_edit",
        "Open file(s) for edit in Perforce",
        MakeSchema({{"files", StringListProp("Files to open for edit")}}, {"files"}),
        FileListDecoder<EditCommand>("p4_edit", strict));

    registry.Register(
        "p4_add",
        "Add new file(s) to Perforce",
        MakeSchema({{"files", StringListProp("Files to add")}}, {"files"}),
        FileListDecoder<AddCommand>("p4_add", strict));

    registry.Register(
        "p4_submit",
        "Submit changes to Perforce",
        MakeSchema({{"description", StringProp("Change description")},
                    {"files", StringListProp("Optional specific files to submit")}},
                   {"description"}),
        [strict](const nlohmann::json& args) -> DecodeResult {
            auto description = RequireString(args, "description", strict);
            if (!description) {
                return DecodeResult::Err(MissingParam("p4_submit", "description"));
            }
            SubmitCommand command;
            command.description = std::move(*description);
            command.files = OptStringList(args, "files");
            return DecodeResult::Ok(std::move(command));
        });

    registry.Register(
        "p4_revert",
        "Revert files in Perforce",
        MakeSchema({{"files", StringListProp("Files to revert")}}, {"files"}),
        FileListDecoder<RevertCommand>("p4_revert", strict));

    registry.Register(
        "p4_opened",
        "List files opened for edit",
        MakeSchema({{"changelist", StringProp("Optional changelist number")}}),
        [](const nlohmann::json& args) -> DecodeResult {
            OpenedCommand command;
            command.changelist = OptString(args, "changelist");
            if (!command.changelist) {
                // Changelist numbers are often sent as JSON integers.
                if (auto number = OptCount(args, "changelist")) {
                    command.changelist = std::to_string(*number);
                }
            }
            return DecodeResult::Ok(std::move(command));
        });

    registry.Register(
        "p4_changes",
        "List recent changes",
        MakeSchema({{"max", IntProp("Maximum number of changes to return",
                                    static_cast<int>(kDefaultChangesMax))},
                    {"path", StringProp("Optional path to filter changes")}}),
        [](const nlohmann::json& args) -> DecodeResult {
            ChangesCommand command;
            command.max = OptCount(args, "max").value_or(kDefaultChangesMax);
            command.path = OptString(args, "path");
            return DecodeResult::Ok(std::move(command));
        });
}

} // namespace p4_mcp
