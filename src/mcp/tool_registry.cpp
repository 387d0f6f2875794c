#include <p4_mcp/mcp/tool_registry.hpp>

namespace p4_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ArgumentDecoder decoder) {
    auto existing = decoders_.find(name);
    if (existing != decoders_.end()) {
        // Re-registration replaces the decoder and keeps the original slot.
        existing->second = std::move(decoder);
        for (auto& d : descriptors_) {
            if (d.name == name) {
                d.description = description;
                d.input_schema = input_schema;
            }
        }
        return;
    }
    descriptors_.push_back({name, description, input_schema});
    decoders_[name] = std::move(decoder);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return decoders_.count(name) > 0;
}

Result<P4Command, ValidationError> ToolRegistry::Decode(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = decoders_.find(name);
    if (it == decoders_.end()) {
        return Result<P4Command, ValidationError>::Err(
            ValidationError{name, "", "Unknown tool: " + name});
    }

    try {
        return it->second(arguments);
    } catch (const nlohmann::json::exception& e) {
        return Result<P4Command, ValidationError>::Err(
            ValidationError{name, "", std::string("Invalid arguments: ") + e.what()});
    }
}

} // namespace p4_mcp
